#ifndef PLX_EXTRACTION_EXCEPTIONS_H
#define PLX_EXTRACTION_EXCEPTIONS_H

#include "../utils/plx_string.h"
#include <exception>

// ============================================================================
// EXTRACTION EXCEPTION HIERARCHY
// ============================================================================
//
// extraction_exception (base)
// ├── source_unavailable_error   PDF missing, unreadable or page out of range
// ├── malformed_rule_error       one rule payload cannot be evaluated
// ├── detector_error             fallback text detector failed
// └── query_error                invalid index query
//
// None of these escapes a page run: providers turn source and detector
// failures into empty token lists, the rule parser skips malformed payloads,
// and the page extractor records anything else as a page failure.
//
// ============================================================================

class extraction_exception : public std::exception {
protected:
  plx_string message_;

public:
  explicit extraction_exception(const plx_string& message)
    : message_(message) {}

  virtual ~extraction_exception() noexcept = default;

  virtual const char* what() const noexcept override {
    return message_.c_str();
  }
};

class source_unavailable_error : public extraction_exception {
  plx_string source_;

public:
  source_unavailable_error(const plx_string& message, const plx_string& source)
    : extraction_exception(message), source_(source) {}

  plx_string get_source() const { return source_; }
};

class malformed_rule_error : public extraction_exception {
  int payload_index_;

public:
  explicit malformed_rule_error(const plx_string& message, int payload_index = -1)
    : extraction_exception(message), payload_index_(payload_index) {}

  // Position in the payload list, -1 when unknown.
  int get_payload_index() const { return payload_index_; }
};

class detector_error : public extraction_exception {
public:
  using extraction_exception::extraction_exception;
};

class query_error : public extraction_exception {
  plx_string code_;

public:
  query_error(const plx_string& code, const plx_string& message)
    : extraction_exception(message), code_(code) {}

  plx_string get_code() const { return code_; }
};

#endif // PLX_EXTRACTION_EXCEPTIONS_H
