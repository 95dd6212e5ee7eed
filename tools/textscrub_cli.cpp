#include <textscrub/diff.hpp>
#include <textscrub/normalize.hpp>
#include <textscrub/rules.hpp>
#include <textscrub/server/config.hpp>
#include <textscrub/server/service.hpp>

#include <json/json.h>

#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

static void usage(const char* argv0) {
  std::cerr
      << "usage:\n"
      << "  " << argv0 << " [options] normalize [file]   print canonical text\n"
      << "  " << argv0 << " [options] diff [file]        print <kind>\\t<text> per segment\n"
      << "  " << argv0 << " [options] json [file]        print the clean endpoint response\n"
      << "  " << argv0 << " [options] rules              list the rule table\n"
      << "\noptions:\n"
      << "  --keyboard-only     also drop non-keyboard characters except emoji\n"
      << "  --no-markdown       keep '*' emphasis and '#' headings\n"
      << "  --max-cells <n>     diff alignment budget, 0 = unlimited\n"
      << "  --lines             diff whole lines\n"
      << "\nWith no file or '-', text is read from stdin.\n";
}

static bool read_input(const std::string& path, std::string* out) {
  if (path.empty() || path == "-") {
    out->assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

// Control bytes are escaped so each segment stays on one line
static std::string escape(const std::string& text) {
  std::string out;
  for (const char c : text) {
    switch (c) {
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\\': out += "\\\\"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}

static std::string describe_rule(const textscrub::SubstitutionRule& rule) {
  char range[40];
  if (rule.matcher == textscrub::MatcherKind::kNonKeyboard) {
    std::snprintf(range, sizeof(range), "non-keyboard");
  } else if (rule.first == rule.last) {
    std::snprintf(range, sizeof(range), "U+%04X", static_cast<unsigned>(rule.first));
  } else {
    std::snprintf(range, sizeof(range), "U+%04X-U+%04X", static_cast<unsigned>(rule.first),
                  static_cast<unsigned>(rule.last));
  }

  std::ostringstream out;
  out << textscrub::CategoryName(rule.category) << "\t" << range << "\t";
  switch (rule.action) {
    case textscrub::RuleAction::kReplace:
      out << "replace \"" << escape(rule.replacement) << "\"";
      break;
    case textscrub::RuleAction::kRemove:
      out << "remove";
      break;
    case textscrub::RuleAction::kShift:
      out << "shift " << rule.shift;
      break;
  }
  return out.str();
}

int main(int argc, char** argv) {
  textscrub::server::Config config;
  bool lines = false;
  std::string cmd;
  std::string path;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--keyboard-only") {
        config.normalizer.keyboard_only = true;
      } else if (arg == "--no-markdown") {
        config.normalizer.strip_markdown = false;
      } else if (arg == "--lines") {
        lines = true;
      } else if (arg == "--max-cells") {
        if (++i >= argc) { usage(argv[0]); return 2; }
        config.diff.max_alignment_cells = textscrub::server::ParseUnsigned(argv[i], "max-cells");
      } else if (arg == "--help" || arg == "-h") {
        usage(argv[0]);
        return 0;
      } else if (arg.size() > 1 && arg[0] == '-') {
        std::cerr << "unknown option: " << arg << "\n";
        usage(argv[0]);
        return 2;
      } else if (cmd.empty()) {
        cmd = arg;
      } else if (path.empty()) {
        path = arg;
      } else {
        usage(argv[0]);
        return 2;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "bad argument: " << e.what() << "\n";
    return 2;
  }

  if (cmd.empty()) { usage(argv[0]); return 2; }

  try {
    const textscrub::RuleSet rules = config.BuildRuleSet();

    if (cmd == "rules") {
      if (!path.empty()) { usage(argv[0]); return 2; }
      for (const auto& rule : rules.rules()) {
        std::cout << describe_rule(rule) << "\n";
      }
      return 0;
    }

    if (cmd != "normalize" && cmd != "diff" && cmd != "json") {
      usage(argv[0]);
      return 2;
    }

    std::string text;
    if (!read_input(path, &text)) {
      std::cerr << "cannot read " << (path.empty() ? "stdin" : path) << "\n";
      return 1;
    }

    if (cmd == "normalize") {
      std::cout << textscrub::Normalizer(rules).Normalize(text);
      return 0;
    }

    if (cmd == "diff") {
      const std::string canonical = textscrub::Normalizer(rules).Normalize(text);
      textscrub::DiffOptions options;
      options.max_alignment_cells = config.diff.max_alignment_cells;
      if (lines) options.granularity = textscrub::DiffGranularity::kLine;

      auto result = textscrub::Diff(text, canonical, options);
      if (!result.success) {
        std::cerr << "diff failed: " << result.error_message << "\n";
        return 1;
      }
      for (const auto& segment : result.segments) {
        std::cout << textscrub::DiffKindName(segment.kind) << "\t" << escape(segment.text) << "\n";
      }
      return 0;
    }

    // json
    config.limits.max_text_bytes = text.size() + 1;
    config.diff.on_limit =
        lines ? textscrub::server::LimitPolicy::kLines : textscrub::server::LimitPolicy::kReject;
    textscrub::server::CleanService service(config);
    auto response = service.Clean(text);

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    writer["emitUTF8"] = true;
    std::cout << Json::writeString(writer, response.body) << "\n";
    return response.status_code == 200 ? 0 : 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
