#include "upload/content_classifier.hpp"
#include <boost/process.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>
#include <iterator>

namespace cfs {
namespace upload {

namespace bp = boost::process;

FileCommandClassifier::FileCommandClassifier(std::string command)
  : command_(std::move(command)) {
}

std::optional<std::string> FileCommandClassifier::classify(const std::filesystem::path& blob) {
  auto executable = bp::search_path(command_);
  if (executable.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Classifier: '" << command_ << "' not found on PATH";
    return std::nullopt;
  }

  bp::ipstream out;
  bp::ipstream err;
  bp::child child(executable, "-b", "--mime-type", blob.string(),
                  bp::std_out > out, bp::std_err > err);

  std::string output{std::istreambuf_iterator<char>(out), std::istreambuf_iterator<char>()};
  std::string message{std::istreambuf_iterator<char>(err), std::istreambuf_iterator<char>()};
  child.wait();

  if (child.exit_code() != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Classifier: file command failed: code=" << child.exit_code()
                               << ": " << boost::algorithm::trim_copy(message);
    return std::nullopt;
  }

  boost::algorithm::trim(output);
  if (output.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "Classifier: file command produced no output for " << blob.string();
    return std::nullopt;
  }

  BOOST_LOG_TRIVIAL(debug) << "Classifier: " << blob.string() << " is " << output;
  return output;
}

} // namespace upload
} // namespace cfs
