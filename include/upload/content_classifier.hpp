#ifndef CFS_UPLOAD_CONTENT_CLASSIFIER_HPP
#define CFS_UPLOAD_CONTENT_CLASSIFIER_HPP

#include <filesystem>
#include <optional>
#include <string>

namespace cfs {
namespace upload {

// Guesses a MIME type from the bytes of a completed blob.
// Implementations may block; nullopt means "no opinion".
class ContentClassifier {
public:
  virtual ~ContentClassifier() = default;
  virtual std::optional<std::string> classify(const std::filesystem::path& blob) = 0;
};

// Runs `file -b --mime-type <blob>`
class FileCommandClassifier : public ContentClassifier {
public:
  explicit FileCommandClassifier(std::string command = "file");

  std::optional<std::string> classify(const std::filesystem::path& blob) override;

private:
  std::string command_;
};

} // namespace upload
} // namespace cfs

#endif // CFS_UPLOAD_CONTENT_CLASSIFIER_HPP
