#include "config/config_file.hpp"

#include "devices/device_model.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iterator>
#include <set>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace camlight::config {

namespace {

using core::errors::Error;
using core::errors::ErrorCode;
using core::errors::SetError;

constexpr std::string_view kParsePrefix = "Failed to parse YAML: ";

std::string Trim(std::string_view input) {
  std::size_t begin = 0;
  while (begin < input.size() && std::isspace(static_cast<unsigned char>(input[begin])) != 0) {
    ++begin;
  }
  std::size_t end = input.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
    --end;
  }
  return std::string(input.substr(begin, end - begin));
}

// One parsed right-hand side.
struct Scalar {
  enum class Kind {
    kNull,
    kString,
    kList,
  };

  Kind kind = Kind::kNull;
  bool quoted = false;
  std::string text;
  std::vector<std::string> items;
};

// Line-oriented parser for the flat YAML subset. Diagnostics carry the
// 1-based line number so a broken config file is quick to fix.
class LineParser {
public:
  explicit LineParser(std::string_view text) : text_(text) {}

  bool Parse(ConfigFile& config, Error& error) {
    config = ConfigFile{};
    std::set<std::string> seen;

    std::size_t start = 0;
    while (start <= text_.size()) {
      const std::size_t newline = text_.find('\n', start);
      const std::size_t end = newline == std::string_view::npos ? text_.size() : newline;
      ++line_number_;

      if (!ParseLine(text_.substr(start, end - start), config, seen, error)) {
        return false;
      }

      if (newline == std::string_view::npos) {
        break;
      }
      start = newline + 1;
    }
    return true;
  }

private:
  bool Fail(const std::string& message, Error& error) const {
    SetError(error, ErrorCode::kConfigFile,
             std::string(kParsePrefix) + "line " + std::to_string(line_number_) + ": " + message);
    return false;
  }

  static std::string StripComment(std::string_view line) {
    char quote = '\0';
    for (std::size_t i = 0; i < line.size(); ++i) {
      const char c = line[i];
      if (quote != '\0') {
        if (c == '\\' && quote == '"') {
          ++i;
        } else if (c == quote) {
          quote = '\0';
        }
        continue;
      }
      if (c == '"' || c == '\'') {
        quote = c;
        continue;
      }
      if (c == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])) != 0)) {
        return std::string(line.substr(0, i));
      }
    }
    return std::string(line);
  }

  bool ParseLine(std::string_view raw_line, ConfigFile& config, std::set<std::string>& seen,
                 Error& error) {
    std::string line = StripComment(raw_line);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (Trim(line).empty()) {
      return true;
    }
    if (Trim(line) == "---") {
      return true;
    }
    if (std::isspace(static_cast<unsigned char>(line.front())) != 0) {
      return Fail("nested values are not supported", error);
    }

    const std::size_t colon = line.find(':');
    if (colon == std::string::npos) {
      return Fail("expected 'key: value'", error);
    }
    if (colon + 1 < line.size() && std::isspace(static_cast<unsigned char>(line[colon + 1])) == 0) {
      return Fail("expected a space after ':'", error);
    }

    const std::string key = Trim(std::string_view(line).substr(0, colon));
    if (key.empty()) {
      return Fail("missing key before ':'", error);
    }

    Scalar value;
    if (!ParseValue(Trim(std::string_view(line).substr(colon + 1)), value, error)) {
      return false;
    }

    const auto& known = KnownConfigKeys();
    if (std::find(known.begin(), known.end(), key) == known.end()) {
      std::string expected;
      for (std::size_t i = 0; i < known.size(); ++i) {
        expected += (i == 0 ? "`" : ", `");
        expected += known[i];
        expected += "`";
      }
      return Fail("unknown field `" + key + "`, expected one of " + expected, error);
    }
    if (!seen.insert(key).second) {
      return Fail("duplicate field `" + key + "`", error);
    }

    return Assign(key, value, config, error);
  }

  bool ParseQuoted(std::string_view raw, std::string& out, std::size_t& consumed,
                   Error& error) const {
    const char quote = raw.front();
    out.clear();
    for (std::size_t i = 1; i < raw.size(); ++i) {
      const char c = raw[i];
      if (quote == '"' && c == '\\') {
        if (i + 1 >= raw.size()) {
          break;
        }
        const char next = raw[++i];
        switch (next) {
        case 'n':
          out.push_back('\n');
          break;
        case 't':
          out.push_back('\t');
          break;
        default:
          out.push_back(next);
          break;
        }
        continue;
      }
      if (quote == '\'' && c == '\'' && i + 1 < raw.size() && raw[i + 1] == '\'') {
        out.push_back('\'');
        ++i;
        continue;
      }
      if (c == quote) {
        consumed = i + 1;
        return true;
      }
      out.push_back(c);
    }
    return Fail("unterminated quoted string", error);
  }

  bool ParseItem(std::string_view raw, std::string& item, Error& error) const {
    const std::string trimmed = Trim(raw);
    if (trimmed.empty()) {
      return Fail("empty list item", error);
    }
    if (trimmed.front() == '"' || trimmed.front() == '\'') {
      std::size_t consumed = 0;
      if (!ParseQuoted(trimmed, item, consumed, error)) {
        return false;
      }
      if (!Trim(std::string_view(trimmed).substr(consumed)).empty()) {
        return Fail("unexpected characters after quoted list item", error);
      }
      return true;
    }
    if (trimmed.find_first_of("[]{}") != std::string::npos) {
      return Fail("nested collections are not supported", error);
    }
    item = trimmed;
    return true;
  }

  bool ParseList(const std::string& raw, Scalar& value, Error& error) const {
    if (raw.back() != ']') {
      return Fail("unterminated flow sequence", error);
    }
    value.kind = Scalar::Kind::kList;
    const std::string body = Trim(std::string_view(raw).substr(1, raw.size() - 2));
    if (body.empty()) {
      return true;
    }

    char quote = '\0';
    std::size_t item_start = 0;
    for (std::size_t i = 0; i <= body.size(); ++i) {
      const bool at_end = i == body.size();
      const char c = at_end ? ',' : body[i];
      if (!at_end && quote != '\0') {
        if (c == '\\' && quote == '"') {
          ++i;
        } else if (c == quote) {
          quote = '\0';
        }
        continue;
      }
      if (!at_end && (c == '"' || c == '\'')) {
        quote = c;
        continue;
      }
      if (c != ',') {
        continue;
      }
      std::string item;
      if (!ParseItem(std::string_view(body).substr(item_start, i - item_start), item, error)) {
        return false;
      }
      value.items.push_back(std::move(item));
      item_start = i + 1;
    }
    if (quote != '\0') {
      return Fail("unterminated quoted string", error);
    }
    return true;
  }

  bool ParseValue(const std::string& raw, Scalar& value, Error& error) const {
    value = Scalar{};
    if (raw.empty() || raw == "~" || raw == "null") {
      return true;
    }

    const char first = raw.front();
    if (first == '[') {
      return ParseList(raw, value, error);
    }
    if (first == '{') {
      return Fail("nested mappings are not supported", error);
    }
    if (first == '&' || first == '*' || first == '!' || first == '|' || first == '>') {
      return Fail("anchors, tags and block scalars are not supported", error);
    }
    if (first == '"' || first == '\'') {
      std::size_t consumed = 0;
      if (!ParseQuoted(raw, value.text, consumed, error)) {
        return false;
      }
      if (!Trim(std::string_view(raw).substr(consumed)).empty()) {
        return Fail("unexpected characters after quoted string", error);
      }
      value.kind = Scalar::Kind::kString;
      value.quoted = true;
      return true;
    }
    if (raw.find_first_of("[]{}") != std::string::npos) {
      return Fail("unexpected flow collection characters in plain scalar", error);
    }

    value.kind = Scalar::Kind::kString;
    value.text = raw;
    return true;
  }

  bool AssignString(const std::string& key, const Scalar& value, std::optional<std::string>& out,
                    Error& error) const {
    if (value.kind == Scalar::Kind::kNull) {
      return true;
    }
    if (value.kind != Scalar::Kind::kString) {
      return Fail("invalid type for `" + key + "`: expected a string", error);
    }
    out = value.text;
    return true;
  }

  bool AssignBool(const std::string& key, const Scalar& value, std::optional<bool>& out,
                  Error& error) const {
    if (value.kind == Scalar::Kind::kNull) {
      return true;
    }
    if (value.kind == Scalar::Kind::kString && !value.quoted) {
      if (value.text == "true" || value.text == "True" || value.text == "TRUE") {
        out = true;
        return true;
      }
      if (value.text == "false" || value.text == "False" || value.text == "FALSE") {
        out = false;
        return true;
      }
    }
    return Fail("invalid type for `" + key + "`: expected a boolean", error);
  }

  bool AssignDelay(const Scalar& value, std::optional<std::uint64_t>& out, Error& error) const {
    if (value.kind == Scalar::Kind::kNull) {
      return true;
    }
    if (value.kind == Scalar::Kind::kString && !value.quoted && !value.text.empty()) {
      std::uint64_t parsed = 0;
      const char* begin = value.text.data();
      const char* end = begin + value.text.size();
      const auto [ptr, ec] = std::from_chars(begin, end, parsed);
      if (ec == std::errc() && ptr == end) {
        out = parsed;
        return true;
      }
    }
    return Fail("invalid value for `delay`: expected a non-negative integer of milliseconds",
                error);
  }

  bool Assign(const std::string& key, const Scalar& value, ConfigFile& config,
              Error& error) const {
    if (key == "serial_number") {
      if (value.kind == Scalar::Kind::kNull) {
        return true;
      }
      if (value.kind == Scalar::Kind::kList) {
        config.serial_numbers = value.items;
      } else {
        config.serial_numbers = std::vector<std::string>{value.text};
      }
      return true;
    }
    if (key == "device_path") {
      return AssignString(key, value, config.device_path, error);
    }
    if (key == "device_type") {
      return AssignString(key, value, config.device_type, error);
    }
    if (key == "video_device") {
      return AssignString(key, value, config.video_device, error);
    }
    if (key == "require_device") {
      return AssignBool(key, value, config.require_device, error);
    }
    if (key == "verbose") {
      return AssignBool(key, value, config.verbose, error);
    }
    if (key == "back") {
      return AssignBool(key, value, config.back, error);
    }
    if (key == "delay") {
      return AssignDelay(value, config.delay_ms, error);
    }
    return Fail("unknown field `" + key + "`", error);
  }

  std::string_view text_;
  std::size_t line_number_ = 0U;
};

} // namespace

const std::vector<std::string_view>& KnownConfigKeys() {
  static const std::vector<std::string_view> kKeys = {
      "serial_number", "device_path", "device_type", "require_device",
      "video_device",  "delay",       "verbose",     "back",
  };
  return kKeys;
}

bool ParseConfigText(std::string_view text, ConfigFile& config, Error& error) {
  core::errors::ClearError(error);

  LineParser parser(text);
  if (!parser.Parse(config, error)) {
    return false;
  }

  if (config.device_type.has_value()) {
    devices::DeviceType parsed_type = devices::DeviceType::kGlow;
    if (!devices::ParseDeviceType(config.device_type.value(), parsed_type, error)) {
      return false;
    }
  }

  devices::DeviceFilter filter;
  if (config.serial_numbers.has_value()) {
    filter.serial_numbers = config.serial_numbers.value();
  }
  filter.device_path = config.device_path;
  // Only the presence of each kind matters for exclusivity.
  if (config.device_type.has_value()) {
    filter.device_type = devices::DeviceType::kGlow;
  }
  return devices::ValidateDeviceFilter(filter, error);
}

bool LoadConfigFile(const fs::path& path, ConfigFile& config, Error& error) {
  core::errors::ClearError(error);

  std::error_code ec;
  if (!fs::exists(path, ec) || ec) {
    SetError(error, ErrorCode::kConfigFile,
             "Failed to read config file: " + path.string() + " does not exist");
    return false;
  }
  if (!fs::is_regular_file(path, ec) || ec) {
    SetError(error, ErrorCode::kConfigFile,
             "Failed to read config file: " + path.string() + " is not a regular file");
    return false;
  }

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    SetError(error, ErrorCode::kConfigFile,
             "Failed to read config file: unable to open " + path.string());
    return false;
  }
  const std::string text((std::istreambuf_iterator<char>(input)),
                         std::istreambuf_iterator<char>());
  return ParseConfigText(text, config, error);
}

} // namespace camlight::config
