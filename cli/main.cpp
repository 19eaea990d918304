/**
 * @file main.cpp
 * @brief euid-cli: one-shot command line front end around the euid library.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11): one subcommand per call, global output options.
 *  - create:  generate one identifier, then count-1 monotonic successors.
 *  - decode:  check and decode a 27-symbol text form.
 *  - from:    build an identifier from a 128-bit unsigned decimal.
 *  - inspect: build an identifier from its raw hi/lo words.
 *  - Print every identifier as pretty (labelled, ANSI), json or raw (text only).
 *
 * Notes:
 *  - Errors go to stderr as one "status=error reason=<name> key=value ..." line.
 *  - Exit codes: 0 ok, 2 usage/validation, 3 decode failure, 4 generation overflow.
 *  - --epoch applies to generation and to the unix_ms projection of every output.
 */

#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "euid/base32.hpp"
#include "euid/euid.hpp"
#include "euid/generator.hpp"
#include "euid/layout.hpp"
#include "euid/status.hpp"

using json = nlohmann::json;

namespace {

constexpr int EXIT_OK        = 0;
constexpr int EXIT_USAGE     = 2;
constexpr int EXIT_DECODE    = 3;
constexpr int EXIT_EXHAUSTED = 4;

// ---------- small utilities ----------

bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold(const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
};

struct OutputOptions {
  std::string format{"pretty"};   // pretty|json|raw
  bool        with_checksum{true};
  uint64_t    epoch_ms{0};
  Ansi        ansi;
};

std::string hex64(uint64_t v) {
  std::ostringstream os;
  os << "0x" << std::uppercase << std::hex << std::setw(16) << std::setfill('0') << v;
  return os.str();
}

std::string hex32(uint32_t v) {
  std::ostringstream os;
  os << "0x" << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
  return os.str();
}

int fail(const std::string& reason, const std::string& details, int code) {
  std::cerr << "status=error reason=" << reason;
  if (!details.empty()) std::cerr << " " << details;
  std::cerr << "\n";
  return code;
}

// ---------- output ----------

json to_json(const euid::EUID& id, const OutputOptions& opt) {
  json j;
  j["text"]      = std::string(id.encode(opt.with_checksum).c_str());
  j["hi"]        = id.hi();
  j["lo"]        = id.lo();
  j["decimal"]   = std::string(id.to_decimal().c_str());
  j["timestamp"] = id.timestamp();
  j["unix_ms"]   = id.timestamp_with_epoch(opt.epoch_ms);
  if (auto ext = id.extension()) j["extension"] = *ext;
  else                           j["extension"] = nullptr;
  j["version"]   = id.version();
  j["sequence"]  = id.sequence();
  j["checksum"]  = id.checksum();
  return j;
}

void print_pretty(const euid::EUID& id, const OutputOptions& opt) {
  const Ansi& a = opt.ansi;
  auto row = [](const char* k) { std::cout << "  " << std::left << std::setw(11) << k; };

  std::cout << a.bold(id.encode(opt.with_checksum).c_str()) << "\n";
  row("hi");        std::cout << hex64(id.hi()) << "\n";
  row("lo");        std::cout << hex64(id.lo()) << "\n";
  row("decimal");   std::cout << id.to_decimal().c_str() << "\n";
  row("timestamp"); std::cout << id.timestamp()
                              << a.dim(" (unix_ms " + std::to_string(id.timestamp_with_epoch(opt.epoch_ms)) + ")")
                              << "\n";
  row("extension");
  if (auto ext = id.extension()) {
    std::cout << *ext << a.dim(" (" + std::to_string(id.extension_len()) + " bits)") << "\n";
  } else {
    std::cout << a.dim("(none)") << "\n";
  }
  row("version");   std::cout << static_cast<int>(id.version()) << "\n";
  row("sequence");  std::cout << hex32(id.sequence()) << "\n";
  row("checksum");  std::cout << static_cast<int>(id.checksum())
                              << (opt.with_checksum ? "" : a.dim(" (not embedded)")) << "\n";
}

void print_all(const std::vector<euid::EUID>& ids, const OutputOptions& opt) {
  if (opt.format == "json") {
    if (ids.size() == 1) {
      std::cout << to_json(ids.front(), opt).dump(2) << "\n";
      return;
    }
    json arr = json::array();
    for (const auto& id : ids) arr.push_back(to_json(id, opt));
    std::cout << arr.dump(2) << "\n";
  } else if (opt.format == "raw") {
    for (const auto& id : ids) std::cout << id.encode(opt.with_checksum).c_str() << "\n";
  } else {
    bool first = true;
    for (const auto& id : ids) {
      if (!first) std::cout << "\n";
      print_pretty(id, opt);
      first = false;
    }
  }
}

// ---------- subcommands ----------

int run_create(std::optional<int> extension, uint32_t count, const OutputOptions& opt) {
  if (extension && (*extension < 0 || *extension > static_cast<int>(euid::layout::EXT_DATA_MASK))) {
    return fail(euid::status_name(euid::EuidStatus::Overflow),
                "field=extension value=" + std::to_string(*extension) + " max=32767", EXIT_USAGE);
  }

  euid::GeneratorConfig cfg;
  cfg.epoch_ms = opt.epoch_ms;
  euid::Generator gen(cfg);

  auto first = extension ? gen.create(static_cast<uint16_t>(*extension)) : gen.create();
  if (!first) {
    return fail(euid::status_name(euid::EuidStatus::Overflow),
                "field=timestamp value=" + std::to_string(gen.current_timestamp()), EXIT_EXHAUSTED);
  }

  std::vector<euid::EUID> ids;
  ids.reserve(count);
  ids.push_back(*first);
  while (ids.size() < count) {
    auto succ = gen.next(ids.back());
    if (!succ) {
      return fail(euid::status_name(euid::EuidStatus::Overflow),
                  "field=sequence produced=" + std::to_string(ids.size()), EXIT_EXHAUSTED);
    }
    ids.push_back(*succ);
  }

  print_all(ids, opt);
  return EXIT_OK;
}

int run_decode(const std::string& text, const OutputOptions& opt) {
  const euid::base32::DecodeResult r = euid::base32::decode(text.data(), text.size());
  const char* reason = euid::status_name(r.status);

  switch (r.status) {
    case euid::EuidStatus::Ok:
      break;
    case euid::EuidStatus::InvalidLength:
      return fail(reason, "actual=" + std::to_string(r.actual_len) +
                          " expected=" + std::to_string(r.expected_len), EXIT_DECODE);
    case euid::EuidStatus::InvalidCharacter: {
      const unsigned char c = static_cast<unsigned char>(r.bad_char);
      std::string shown = (c >= 0x21 && c < 0x7F) ? std::string(1, r.bad_char)
                                                   : "0x" + std::to_string(static_cast<int>(c));
      return fail(reason, "char=" + shown + " pos=" + std::to_string(r.bad_pos), EXIT_DECODE);
    }
    case euid::EuidStatus::ChecksumMismatch:
      return fail(reason, "embedded=" + std::to_string(r.embedded_checksum) +
                          " computed=" + std::to_string(r.computed_checksum), EXIT_DECODE);
    default:
      return fail(reason, "", EXIT_DECODE);
  }

  print_all({r.id}, opt);
  return EXIT_OK;
}

int run_from_decimal(const std::string& decimal, const OutputOptions& opt) {
  auto id = euid::EUID::from_decimal(decimal.c_str());
  if (!id) return fail("invalid_decimal", "value=" + decimal, EXIT_USAGE);
  print_all({*id}, opt);
  return EXIT_OK;
}

} // namespace

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_format = "pretty";
  bool        opt_no_color = false;
  bool        opt_no_checksum = false;
  uint64_t    opt_epoch = 0;

  CLI::App app{"EUID command line tool"};
  app.require_subcommand(1);
  app.fallthrough(true);
  app.add_option("--format", opt_format, "Output format: pretty|json|raw")
     ->check(CLI::IsMember({"pretty", "json", "raw"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_flag("--no-checksum", opt_no_checksum, "Embed the 'no checksum' sentinel in printed text");
  app.add_option("--epoch", opt_epoch, "Custom epoch in Unix ms (generation and unix_ms)");

  // create
  int opt_extension = 0;
  uint32_t opt_count = 1;
  auto cmd_create = app.add_subcommand("create", "Generate identifiers");
  auto ext_opt = cmd_create->add_option("--extension", opt_extension, "Caller tag (0..32767)");
  cmd_create->add_option("--count", opt_count, "Number of identifiers (monotonic after the first)")
            ->capture_default_str()
            ->check(CLI::Range(uint32_t{1}, uint32_t{1000000}));

  // decode
  std::string opt_text;
  auto cmd_decode = app.add_subcommand("decode", "Decode a 27-symbol text form");
  cmd_decode->add_option("text", opt_text, "Encoded identifier")->required();

  // from
  std::string opt_decimal;
  auto cmd_from = app.add_subcommand("from", "Build from a 128-bit unsigned decimal");
  cmd_from->add_option("decimal", opt_decimal, "Decimal value")->required();

  // inspect
  uint64_t opt_hi = 0, opt_lo = 0;
  auto cmd_inspect = app.add_subcommand("inspect", "Build from raw words");
  cmd_inspect->add_option("--hi", opt_hi, "Most significant word")->required();
  cmd_inspect->add_option("--lo", opt_lo, "Least significant word")->required();

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    const int rc = app.exit(e);
    return rc == 0 ? EXIT_OK : EXIT_USAGE;
  }

  OutputOptions out;
  out.format        = opt_format;
  out.with_checksum = !opt_no_checksum;
  out.epoch_ms      = opt_epoch;
  out.ansi.enabled  = !opt_no_color && is_tty_stdout() && (opt_format == "pretty");

  if (*cmd_create) {
    std::optional<int> ext;
    if (ext_opt->count() > 0) ext = opt_extension;
    return run_create(ext, opt_count, out);
  }
  if (*cmd_decode)  return run_decode(opt_text, out);
  if (*cmd_from)    return run_from_decimal(opt_decimal, out);
  if (*cmd_inspect) {
    print_all({euid::EUID(opt_hi, opt_lo)}, out);
    return EXIT_OK;
  }

  return fail("need_subcommand", "", EXIT_USAGE);
}
