#include "plx_vision_text_detector.h"
#include "../client/plx_http_request.h"
#include "../json/plx_json.h"
#include "../../extraction/plx_extraction_exceptions.h"
#include <openssl/evp.h>
#include <iostream>

namespace {

  const char* system_prompt =
    "You are reading a construction plan page and locating text blocks.\n"
    "Report every visible text block that could be a room label, a room number, "
    "a door number or a similar identifier.\n"
    "Answer with a JSON array only:\n"
    "[{\"bbox\": [x, y, width, height], \"text\": \"content\", \"confidence\": 0.0-1.0}]\n"
    "bbox values are pixels measured from the top-left corner of the image. "
    "Multi-line blocks keep their line breaks. confidence reflects legibility.";

  const char* user_prompt =
    "Find all room labels, room numbers, and door numbers visible on this construction plan. "
    "Return ONLY a JSON array of text blocks with their approximate bounding boxes.";

  plx_string base64_encode(const std::vector<unsigned char>& data)
  {
    if (data.empty())
    {
      return plx_string();
    }
    // EVP_EncodeBlock writes a trailing NUL after the encoded text.
    std::vector<unsigned char> buffer(4 * ((data.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(buffer.data(), data.data(), static_cast<int>(data.size()));
    if (written <= 0)
    {
      return plx_string();
    }
    return plx_string(std::string(buffer.begin(), buffer.begin() + written));
  }

  plx_string image_mime_type(const std::vector<unsigned char>& data)
  {
    if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF)
    {
      return "image/jpeg";
    }
    return "image/png";
  }

  // Models sometimes wrap the array in a markdown fence.
  plx_string strip_code_fence(const plx_string& content)
  {
    plx_string text = content.trim();
    if (!text.starts_with("```"))
    {
      return text;
    }
    size_t first_newline = text.find("\n");
    if (first_newline == plx_string::npos)
    {
      return text;
    }
    text = text.substr(first_newline + 1);
    if (text.trim().ends_with("```"))
    {
      plx_string trimmed = text.trim();
      text = trimmed.substr(0, trimmed.size() - 3);
    }
    return text.trim();
  }

} // namespace

plx_vision_text_detector::plx_vision_text_detector(const plx_string& endpoint, const plx_string& api_key,
                                                   const plx_string& model)
  : endpoint_(endpoint), api_key_(api_key), model_(model), timeout_seconds_(120)
{
  // Pages are detected from worker threads; libcurl's global setup must happen first.
  if (!plx_http_request::ensure_global_init())
  {
    std::cerr << "Warning: libcurl initialization failed, text detection requests will fail" << std::endl;
  }
}

plxv_map plx_vision_text_detector::build_request(const std::vector<unsigned char>& image_bytes) const
{
  plxv_map system_message;
  system_message["role"] = "system";
  system_message["content"] = system_prompt;

  plxv_map text_part;
  text_part["type"] = "text";
  text_part["text"] = user_prompt;

  plxv_map image_url;
  image_url["url"] = "data:" + image_mime_type(image_bytes) + ";base64," + base64_encode(image_bytes);
  plxv_map image_part;
  image_part["type"] = "image_url";
  image_part["image_url"] = image_url;

  plxv_map user_message;
  user_message["role"] = "user";
  user_message["content"] = plxv_vector{plx_variant(text_part), plx_variant(image_part)};

  plxv_map request;
  request["model"] = model_;
  request["messages"] = plxv_vector{plx_variant(system_message), plx_variant(user_message)};
  return request;
}

std::vector<plx_text_detection> plx_vision_text_detector::detect(const plx_string& page_id,
                                                                 const std::vector<unsigned char>& image_bytes)
{
  if (api_key_.empty())
  {
    throw detector_error("No API key configured for the vision detector");
  }
  if (image_bytes.empty())
  {
    throw detector_error("Empty page image for page " + page_id.to_std_const());
  }

  plxv_map request_map = build_request(image_bytes);
  plx_json json_handler(&request_map);
  plx_string body = json_handler.create();
  if (body.empty())
  {
    throw detector_error("Failed to create JSON request body");
  }

  plx_http_request request(endpoint_);
  request.set_method("POST");
  request.set_header("Content-Type", "application/json");
  request.set_header("Authorization", "Bearer " + api_key_);
  request.set_timeout_seconds(timeout_seconds_);
  request.set_body(body);

  std::cout << "Vision text detection for page " << page_id << " (" << image_bytes.size() << " bytes)" << std::endl;
  if (!request.send())
  {
    throw detector_error("Vision request failed: " + request.get_error_message().to_std_const());
  }

  std::vector<plx_text_detection> detections = parse_response(request.get_response_body());
  std::cout << "Vision detector returned " << detections.size() << " blocks for page " << page_id << std::endl;
  return detections;
}

std::vector<plx_text_detection> plx_vision_text_detector::parse_response(const plx_string& response_body)
{
  plxv_map response_map;
  plx_json response_handler(&response_map);
  if (!response_handler.parse(response_body))
  {
    throw detector_error("Vision response is not a JSON object");
  }

  auto choices = response_map.find("choices");
  if (choices == response_map.end() || !choices->second.is_vector() || choices->second.vector_value().empty())
  {
    throw detector_error("Vision response has no choices");
  }
  const plx_variant& first = choices->second.vector_value()[0];
  if (!first.is_map() || !first.map_value().count("message") || !first.map_value().at("message").is_map())
  {
    throw detector_error("Vision response choice has no message");
  }
  const plxv_map& message = first.map_value().at("message").map_value();
  auto content = message.find("content");
  if (content == message.end() || !content->second.is_string())
  {
    throw detector_error("Vision response message has no text content");
  }

  plx_variant parsed;
  if (!plx_json::parse_value(strip_code_fence(content->second.string_value()), parsed) || !parsed.is_vector())
  {
    throw detector_error("Vision response content is not a JSON array");
  }

  std::vector<plx_text_detection> detections;
  for (const auto& raw : parsed.vector_value())
  {
    if (!raw.is_map())
    {
      std::cerr << "Warning: Skipping non-object text block in vision response" << std::endl;
      continue;
    }
    const plxv_map& block = raw.map_value();
    plx_text_detection detection;
    detection.confidence = 1.0;

    auto bbox = block.find("bbox");
    if (bbox != block.end() && bbox->second.is_vector())
    {
      for (const auto& v : bbox->second.vector_value())
      {
        detection.bbox.push_back(v.number_value(-1.0));
      }
    }
    auto text = block.find("text");
    if (text != block.end() && text->second.is_string())
    {
      detection.text = text->second.string_value();
    }
    auto confidence = block.find("confidence");
    if (confidence != block.end() && confidence->second.is_number())
    {
      detection.confidence = confidence->second.number_value();
    }
    detections.push_back(detection);
  }
  return detections;
}
