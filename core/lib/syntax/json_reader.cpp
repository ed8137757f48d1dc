// itl/syntax/json_reader.cpp - JSON parse stage
#include "itl/syntax/json_reader.hpp"

#include <algorithm>
#include <set>
#include <utility>
#include <vector>

namespace itl
{

namespace
{

using nlohmann::json;

/**
 * Tracks the document path while the SAX-style callback walks the input,
 * and the keys already seen in every open object.
 */
class KeyTracker
{
public:
  explicit KeyTracker(DiagnosticBag & diags) : diags_(diags) {}

  bool on_event(json::parse_event_t event, const json & parsed)
  {
    switch (event) {
      case json::parse_event_t::object_start:
        advance_parent();
        frames_.push_back(Frame{true, {}, {}, 0, false});
        break;
      case json::parse_event_t::array_start:
        advance_parent();
        frames_.push_back(Frame{false, {}, {}, 0, false});
        break;
      case json::parse_event_t::object_end:
      case json::parse_event_t::array_end:
        if (!frames_.empty()) frames_.pop_back();
        break;
      case json::parse_event_t::key:
        on_key(parsed.get<std::string>());
        break;
      case json::parse_event_t::value:
        advance_parent();
        break;
    }
    return true;
  }

private:
  struct Frame
  {
    bool is_object;
    std::set<std::string> keys;
    std::string key;
    size_t index;
    bool started;
  };

  // A new element begins inside the innermost array.
  void advance_parent()
  {
    if (frames_.empty() || frames_.back().is_object) return;
    Frame & top = frames_.back();
    top.index = top.started ? top.index + 1 : 0;
    top.started = true;
  }

  void on_key(std::string key)
  {
    if (frames_.empty()) return;
    Frame & top = frames_.back();
    if (!top.keys.insert(key).second) {
      std::string path = join_path(enclosing_path(), key);
      diags_
        .report_warning(
          Stage::Parse, "duplicate-key", path, "key '" + key + "' appears more than once")
        .with_help("the last value is used");
    }
    top.key = std::move(key);
  }

  // Path of the innermost open object
  [[nodiscard]] std::string enclosing_path() const
  {
    std::string path;
    for (size_t i = 0; i + 1 < frames_.size(); ++i) {
      const Frame & f = frames_[i];
      path = f.is_object ? join_path(path, f.key) : index_path(path, f.index);
    }
    return path;
  }

  DiagnosticBag & diags_;
  std::vector<Frame> frames_;
};

/// "[json.exception.parse_error.101] parse error at ..." -> "parse error at ..."
std::string strip_exception_prefix(const std::string & what)
{
  if (!what.empty() && what.front() == '[') {
    const auto pos = what.find("] ");
    if (pos != std::string::npos) {
      return what.substr(pos + 2);
    }
  }
  return what;
}

}  // namespace

std::optional<nlohmann::json> parse_json(const SourceFile & source, DiagnosticBag & diags)
{
  KeyTracker tracker(diags);
  json::parser_callback_t callback = [&tracker](int /*depth*/, json::parse_event_t event,
                                                json & parsed) {
    return tracker.on_event(event, parsed);
  };

  try {
    return json::parse(source.content().begin(), source.content().end(), callback);
  } catch (const json::parse_error & e) {
    // e.byte is 1-based and may point one past the end on truncated input.
    const auto size = static_cast<uint32_t>(source.size());
    const auto offset = static_cast<uint32_t>(std::min<size_t>(e.byte > 0 ? e.byte - 1 : 0, size));
    const uint32_t end = offset < size ? offset + 1 : offset;
    diags
      .report_error(
        Stage::Parse, "json-syntax", std::string(), strip_exception_prefix(e.what()))
      .with_range(SourceRange(offset, end));
  } catch (const json::exception & e) {
    diags.report_error(
      Stage::Parse, "json-syntax", std::string(), strip_exception_prefix(e.what()));
  }
  return std::nullopt;
}

}  // namespace itl
