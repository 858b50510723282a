#include "response_parser.hpp"

#include <cstddef>
#include <sstream>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/util/errors.hpp"

namespace blockforge::oracle {

namespace {

constexpr std::string_view kBackendHeading     = "## Backend Code";
constexpr std::string_view kFrontendHeading    = "## Frontend Code";
constexpr std::string_view kExplanationHeading = "## Explanation";
constexpr std::string_view kFence              = "```";

std::string_view Trim(std::string_view s) {
  const auto begin = s.find_first_not_of(" \t\r");
  if (begin == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

std::vector<std::string> SplitLines(const std::string& content) {
  std::vector<std::string> lines;
  std::istringstream       in(content);
  std::string              line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(line);
  }
  return lines;
}

class SectionReader {
 public:
  explicit SectionReader(std::vector<std::string> lines) : lines_(std::move(lines)) {
  }

  // Advances past the heading or throws.
  void ExpectHeading(std::string_view heading) {
    while (pos_ < lines_.size() && Trim(lines_[pos_]) != heading) {
      ++pos_;
    }
    if (pos_ == lines_.size()) {
      throw util::OracleFailure("oracle response is missing the '" + std::string(heading) + "' section");
    }
    ++pos_;
  }

  // Reads one fenced block directly after a heading (blank lines allowed).
  std::string ReadFencedBlock(std::string_view section) {
    while (pos_ < lines_.size() && Trim(lines_[pos_]).empty()) {
      ++pos_;
    }
    if (pos_ == lines_.size() || Trim(lines_[pos_]).substr(0, kFence.size()) != kFence) {
      throw util::OracleFailure("oracle response has no code fence in the '" + std::string(section) + "' section");
    }
    ++pos_;

    std::string body;
    for (; pos_ < lines_.size(); ++pos_) {
      if (Trim(lines_[pos_]) == kFence) {
        ++pos_;
        return body;
      }
      body += lines_[pos_];
      body.push_back('\n');
    }
    throw util::OracleFailure("oracle response has an unterminated code fence in the '" + std::string(section) + "' section");
  }

  std::string ReadRemainder() {
    std::string text;
    for (; pos_ < lines_.size(); ++pos_) {
      text += lines_[pos_];
      text.push_back('\n');
    }
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    return text.substr(begin, text.find_last_not_of(" \t\r\n") - begin + 1);
  }

 private:
  std::vector<std::string> lines_;
  std::size_t              pos_ = 0;
};

bool IsBlank(const std::string& s) {
  return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

GeneratedCode ParseOracleResponse(const std::string& content) {
  SectionReader reader(SplitLines(content));
  GeneratedCode code;

  reader.ExpectHeading(kBackendHeading);
  code.backend_code = reader.ReadFencedBlock(kBackendHeading);
  if (IsBlank(code.backend_code)) {
    throw util::OracleFailure("oracle response has an empty backend code block");
  }

  reader.ExpectHeading(kFrontendHeading);
  code.frontend_code = reader.ReadFencedBlock(kFrontendHeading);

  reader.ExpectHeading(kExplanationHeading);
  code.explanation = reader.ReadRemainder();
  return code;
}

} // namespace blockforge::oracle
