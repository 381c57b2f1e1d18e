#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ansiviz {

// Malformed YAML in a caller-supplied playbook. Aborts the generation.
class FormatError : public std::runtime_error {
public:
  FormatError(std::string path, const std::string &detail)
      : std::runtime_error("Invalid YAML in " + path + ": " + detail),
        path_(std::move(path)) {}

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

// A caller-supplied inventory or playbook cannot be found or opened.
class MissingResourceError : public std::runtime_error {
public:
  MissingResourceError(std::string path, const std::string &what)
      : std::runtime_error(what + ": " + path), path_(std::move(path)) {}

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

} // namespace ansiviz
