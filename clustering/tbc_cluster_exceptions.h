#ifndef TBC_CLUSTER_EXCEPTIONS_H
#define TBC_CLUSTER_EXCEPTIONS_H

#include "../utils/tbc_string.h"
#include <exception>
#include <stdexcept>

// ============================================================================
// CLUSTERING EXCEPTION HIERARCHY
// ============================================================================
//
// tbc_exception (base)
// ├── tbc_empty_page_error
// ├── tbc_document_error
// └── tbc_feed_error
//
// ============================================================================

class tbc_exception : public std::exception {
protected:
  tbc_string message_;

public:
  explicit tbc_exception(const tbc_string& message)
    : message_(message) {}

  virtual ~tbc_exception() noexcept = default;

  virtual const char* what() const noexcept override {
    return message_.c_str();
  }
};

// No spans left to cluster on the page
class tbc_empty_page_error : public tbc_exception {
public:
  explicit tbc_empty_page_error(const tbc_string& message = "Empty page: no text spans found.")
    : tbc_exception(message) {}
};

// PDF file missing, unreadable, without pages or page index out of range
class tbc_document_error : public tbc_exception {
  tbc_string filename_;

public:
  tbc_document_error(const tbc_string& message, const tbc_string& filename)
    : tbc_exception(message), filename_(filename) {}

  tbc_string get_filename() const { return filename_; }
};

// Serialized page feed that cannot be read at all
class tbc_feed_error : public tbc_exception {
public:
  using tbc_exception::tbc_exception;
};

#endif // TBC_CLUSTER_EXCEPTIONS_H
