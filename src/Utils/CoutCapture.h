#pragma once

#include <iostream>
#include <sstream>
#include <string>

// RAII for redirecting an ostream (std::cout unless told otherwise).
// Text::apply prints to std::cout by default, tests use this to read it back.
class CoutCapture {
  std::ostringstream captured;
  std::ostream& target;
  std::streambuf* old_buf;
public:
  explicit CoutCapture(std::ostream& os = std::cout)
      : target(os), old_buf(os.rdbuf(captured.rdbuf())) {}
  ~CoutCapture() { target.rdbuf(old_buf); }

  CoutCapture(const CoutCapture&) = delete;
  CoutCapture& operator=(const CoutCapture&) = delete;

  std::string str() const {
    return captured.str();
  }
};
