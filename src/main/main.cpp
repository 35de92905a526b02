#include "byline/file_reader.hpp"
#include "byline/metrics.hpp"
#include "byline/path_utils.hpp"
#include "byline/pipeline.hpp"
#include "byline/reader.hpp"
#include "byline/run_json.hpp"

#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <regex>
#include <string>
#include <vector>
#include <unistd.h>

namespace {

struct Cli {
  char rs = '\n';
  std::string fs = "\\s+";
  std::string grep;
  std::string grep_v;
  bool upper = false;
  bool lower = false;
  std::vector<std::size_t> fields;   // 1-based, 0 = whole line
  std::string ofs = " ";
  bool number = false;
  std::string stats_path;
  bool quiet = false;
  bool line_buffered = false;        // flush after every record
  std::vector<std::string> inputs;   // empty or "-" -> stdin
};

void usage(std::ostream& os) {
  os <<
    "Usage: byline [--rs=C] [--fs=REGEX] [--grep=REGEX] [--grep-v=REGEX]\n"
    "              [--fields=N[,N...]] [--ofs=S] [--upper|--lower] [--number]\n"
    "              [--stats=PATH] [--line-buffered] [--quiet] [file...]\n"
    "Reads stdin when no file (or '-') is given. Output is flushed per record\n"
    "with --line-buffered or when stdout is a terminal.\n";
}

bool parse_rs(const std::string& v, char* out) {
  if (v.size() == 1) { *out = v[0]; return true; }
  if (v == "\\n") { *out = '\n'; return true; }
  if (v == "\\t") { *out = '\t'; return true; }
  if (v == "\\r") { *out = '\r'; return true; }
  if (v == "\\0") { *out = '\0'; return true; }
  return false;
}

bool parse_fields(const std::string& v, std::vector<std::size_t>* out) {
  out->clear();
  std::size_t start = 0;
  while (start <= v.size()) {
    std::size_t comma = v.find(',', start);
    std::string tok = v.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
    if (tok.empty()) return false;
    for (char c : tok) if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    out->push_back(static_cast<std::size_t>(std::stoul(tok)));
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return !out->empty();
}

// Returns 0 to continue, otherwise the process exit code.
int parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    if (eat("--rs=", &v)) {
      if (!parse_rs(v, &c.rs)) { std::cerr << "[byline] --rs wants a single byte, got '" << v << "'\n"; return 2; }
      continue;
    }
    if (eat("--fields=", &v)) {
      if (!parse_fields(v, &c.fields)) { std::cerr << "[byline] bad --fields list '" << v << "'\n"; return 2; }
      continue;
    }
    if (eat("--fs=", &c.fs)) continue;
    if (eat("--grep=", &c.grep)) continue;
    if (eat("--grep-v=", &c.grep_v)) continue;
    if (eat("--ofs=", &c.ofs)) continue;
    if (eat("--stats=", &c.stats_path)) continue;
    if (a == "--upper")  { c.upper  = true; continue; }
    if (a == "--lower")  { c.lower  = true; continue; }
    if (a == "--number") { c.number = true; continue; }
    if (a == "--quiet")  { c.quiet  = true; continue; }
    if (a == "--line-buffered") { c.line_buffered = true; continue; }
    if (a == "-h" || a == "--help") { usage(std::cout); std::exit(0); }
    if (a.size() > 1 && a[0] == '-' && a != "-") {
      std::cerr << "[byline] unknown option " << a << "\n";
      usage(std::cerr);
      return 2;
    }
    c.inputs.push_back(a);
  }
  if (c.upper && c.lower) { std::cerr << "[byline] --upper and --lower are exclusive\n"; return 2; }
  if (c.inputs.empty()) c.inputs.push_back("-");
  return 0;
}

struct Patterns {
  std::unique_ptr<std::regex> grep;
  std::unique_ptr<std::regex> grep_v;
};

// Wire the CLI options into `p`, in a fixed order:
// grep, grep-v, fields, case mapping, numbering.
void configure(bl::Pipeline& p, const Cli& c, const Patterns& pats, std::uint64_t nr_base) {
  if (pats.grep) p.grep_regex(*pats.grep);
  if (pats.grep_v) {
    const std::regex* re = pats.grep_v.get();
    p.grep([re](std::string_view line){ return !std::regex_search(line.begin(), line.end(), *re); });
  }
  if (!c.fields.empty()) {
    p.awk([&c](std::string_view, const bl::Fields& f, const bl::AwkVars&, std::string& out){
      out.clear();
      for (std::size_t i = 0; i < c.fields.size(); ++i) {
        if (i) out += c.ofs;
        out.append(f.field(c.fields[i]));
      }
      return bl::Status::ok();
    });
  }
  if (c.upper || c.lower) {
    const bool up = c.upper;
    p.map([up](std::string_view line){
      std::string out(line);
      for (auto& ch : out) {
        auto u = static_cast<unsigned char>(ch);
        ch = static_cast<char>(up ? std::toupper(u) : std::tolower(u));
      }
      return out;
    });
  }
  if (c.number) {
    const bl::AwkVars* vars = &p.vars();
    p.map_string([vars, nr_base](const std::string& line){
      return std::to_string(nr_base + vars->nr) + "\t" + line;
    });
  }
}

std::vector<std::string> describe_filters(const Cli& c) {
  std::vector<std::string> out;
  if (!c.grep.empty())   out.push_back("grep:" + c.grep);
  if (!c.grep_v.empty()) out.push_back("grep-v:" + c.grep_v);
  if (!c.fields.empty()) {
    std::string f = "fields:";
    for (std::size_t i = 0; i < c.fields.size(); ++i) { if (i) f += ","; f += std::to_string(c.fields[i]); }
    out.push_back(f);
  }
  if (c.upper)  out.push_back("upper");
  if (c.lower)  out.push_back("lower");
  if (c.number) out.push_back("number");
  return out;
}

void add_stats(bl::PipelineStats& acc, const bl::PipelineStats& s) {
  acc.records_in      += s.records_in;
  acc.records_out     += s.records_out;
  acc.records_omitted += s.records_omitted;
  acc.bytes_in        += s.bytes_in;
  acc.bytes_out       += s.bytes_out;
}

}

int main(int argc, char** argv) {
  Cli cli;
  if (int rc = parse_cli(argc, argv, cli)) return rc;

  Patterns pats;
  try {
    std::regex fs_check(cli.fs);
    (void)fs_check;
    if (!cli.grep.empty())   pats.grep.reset(new std::regex(cli.grep));
    if (!cli.grep_v.empty()) pats.grep_v.reset(new std::regex(cli.grep_v));
  } catch (const std::regex_error& e) {
    std::cerr << "[byline] bad pattern: " << e.what() << "\n";
    return 2;
  }

  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  std::ios::sync_with_stdio(false);
  if (cli.line_buffered || ::isatty(STDOUT_FILENO)) std::cout << std::unitbuf;

  bl::PipelineStats total;
  bl::Status last = bl::Status::ok();
  int rc = 0;

  for (const auto& in : cli.inputs) {
    std::unique_ptr<bl::Reader> src;
    if (in == "-") {
      src.reset(new bl::StreamReader(std::cin));
    } else {
      auto* fr = new bl::FileReader(in);
      src.reset(fr);
      if (!fr->open()) {
        std::cerr << "[byline] cannot open " << in << ": " << std::strerror(fr->last_error()) << "\n";
        rc = 3;
        continue;
      }
    }

    bl::Pipeline::Config pcfg;
    pcfg.rs = cli.rs;
    pcfg.fs = cli.fs;
    bl::Pipeline p(*src, pcfg);
    configure(p, cli, pats, total.records_in);

    std::uint64_t written = 0;
    bl::Status st = bl::copy(p, std::cout, &written);
    add_stats(total, p.stats());
    if (!st.is_ok()) {
      std::cerr << "[byline] " << (in == "-" ? "<stdin>" : in) << ": " << st.to_string() << "\n";
      last = st;
      rc = 1;
      break;
    }
    if (!cli.quiet) {
      std::cerr << "[byline] ok: " << (in == "-" ? "<stdin>" : in)
                << " records=" << p.stats().records_in
                << " out=" << p.stats().records_out
                << " bytes=" << written << "\n";
    }
  }
  std::cout.flush();

  const auto t1 = ch::steady_clock::now();
  const double wall_ms = ch::duration<double, std::milli>(t1 - t0).count();

  if (!cli.stats_path.empty()) {
    bl::RunJsonPayload pl{};
    pl.records_in      = total.records_in;
    pl.records_out     = total.records_out;
    pl.records_omitted = total.records_omitted;
    pl.bytes_in        = total.bytes_in;
    pl.bytes_out       = total.bytes_out;
    pl.wall_time_ms    = wall_ms;
    pl.throughput_mb_s = bl::throughput_mb_s(total.bytes_in, wall_ms);
    pl.records_per_sec = bl::rate_per_sec(total.records_in, wall_ms);
    pl.inputs  = cli.inputs;
    pl.rs      = cli.rs;
    pl.fs      = cli.fs;
    pl.filters = describe_filters(cli);
    pl.status  = last.to_string();

    std::string err;
    if (!bl::write_text_file(cli.stats_path, bl::RunJsonWriter::to_json(pl), &err)) {
      std::cerr << "[byline] stats: " << err << "\n";
      return rc ? rc : 4;
    }
    if (!cli.quiet) std::cerr << "[byline] stats -> " << cli.stats_path << "\n";
  }
  return rc;
}
