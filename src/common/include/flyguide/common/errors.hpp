#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace flyguide::common {

// Root of every failure a prep run can report. All of them are fatal: the CLI
// maps each to exit code 1.
class PrepError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class UsageError : public PrepError {
 public:
  using PrepError::PrepError;
};

class ConfigError : public PrepError {
 public:
  using PrepError::PrepError;
};

class InputNotFoundError : public PrepError {
 public:
  explicit InputNotFoundError(std::filesystem::path path);

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

class EmptyInputError : public PrepError {
 public:
  explicit EmptyInputError(std::filesystem::path path);

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

class MissingColumnsError : public PrepError {
 public:
  MissingColumnsError(std::vector<std::string> missing, std::vector<std::string> found);

  const std::vector<std::string>& missing() const { return missing_; }
  const std::vector<std::string>& found() const { return found_; }

 private:
  std::vector<std::string> missing_;
  std::vector<std::string> found_;
};

class IoError : public PrepError {
 public:
  IoError(std::filesystem::path path, const std::string& what);

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

// Renders names as ['a', 'b'] for diagnostics.
std::string formatNameList(const std::vector<std::string>& names);

}  // namespace flyguide::common
