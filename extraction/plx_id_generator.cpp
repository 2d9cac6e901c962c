#include "plx_id_generator.h"
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

namespace plx::extraction {

  namespace {

    std::vector<unsigned char> sha256(const plx_string& data)
    {
      std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
      if (!ctx)
      {
        throw std::runtime_error("EVP_MD_CTX_new failed");
      }

      std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
      unsigned int length = 0;
      if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
          EVP_DigestUpdate(ctx.get(), data.c_str(), data.size()) != 1 ||
          EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1)
      {
        throw std::runtime_error("SHA-256 digest failed");
      }
      digest.resize(length);
      return digest;
    }

    plx_string to_hex(const unsigned char* bytes, size_t count)
    {
      static const char digits[] = "0123456789abcdef";
      plx_string out;
      for (size_t i = 0; i < count; ++i)
      {
        out += digits[bytes[i] >> 4];
        out += digits[bytes[i] & 0x0F];
      }
      return out;
    }

  } // namespace

  plx_string normalize_label(const plx_string& label)
  {
    return label.lower().trim().strip_punctuation().normalize_whitespace();
  }

  int bucket_coordinate(int value, int bucket_size)
  {
    if (bucket_size <= 0)
    {
      throw std::invalid_argument("bucket size must be positive");
    }
    int quotient = value / bucket_size;
    if (value % bucket_size != 0 && value < 0)
    {
      --quotient;
    }
    return quotient * bucket_size;
  }

  std::array<int, 4> bucket_corners(const plx_layout_bounds& bbox, int bucket_size)
  {
    return {bucket_coordinate(bbox.get_left(), bucket_size),
            bucket_coordinate(bbox.get_top(), bucket_size),
            bucket_coordinate(bbox.get_right(), bucket_size),
            bucket_coordinate(bbox.get_bottom(), bucket_size)};
  }

  plx_string sha256_hex(const plx_string& data)
  {
    std::vector<unsigned char> digest = sha256(data);
    return to_hex(digest.data(), digest.size());
  }

  plx_string generate_object_id(const plx_string& page_id, const plx_string& object_type, const plx_string& label,
                                const plx_layout_bounds& bbox, const plx_string& qualifier)
  {
    std::array<int, 4> corners = bucket_corners(bbox);
    plx_string corner_text = plx_string("(") + plx_string(corners[0]) + ", " + plx_string(corners[1]) + ", " +
                             plx_string(corners[2]) + ", " + plx_string(corners[3]) + ")";

    std::vector<plx_string> parts = {page_id, object_type, normalize_label(label), corner_text};
    if (!qualifier.empty())
    {
      parts.push_back(qualifier);
    }

    std::vector<unsigned char> digest = sha256(plx_string("|").join(parts));
    return object_type + "_" + to_hex(digest.data(), 8);
  }

  plx_string generate_room_id(const plx_string& page_id, const plx_string& label, const plx_layout_bounds& bbox,
                              const plx_string& room_number)
  {
    return generate_object_id(page_id, "room", label, bbox, room_number);
  }

  plx_string generate_door_id(const plx_string& page_id, const plx_string& label, const plx_layout_bounds& bbox,
                              const plx_string& door_number)
  {
    return generate_object_id(page_id, "door", label, bbox, door_number);
  }

} // namespace plx::extraction
