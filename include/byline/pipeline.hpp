#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "byline/fields.hpp"
#include "byline/filter_chain.hpp"
#include "byline/metrics.hpp"
#include "byline/reader.hpp"
#include "byline/status.hpp"

namespace bl {

// AWK-style state, see awk(1).
struct AwkVars {
  std::uint64_t nr = 0;               // current record number, from 1
  std::size_t   nf = 0;               // fields in the current record
  char          rs = '\n';            // record separator
  std::string_view fs;                // field pattern source ("" if set from a std::regex)
  const std::regex* fs_re = nullptr;  // compiled field pattern
};

// (line without its separator, fields, state snapshot, replacement line)
using AwkFn = std::function<Status(std::string_view line, const Fields& fields,
                                   const AwkVars& vars, std::string& out)>;

// Record-by-record transformation over a Reader, itself a Reader.
//
//   bl::StringReader in("a 1\nb 2\n");
//   bl::Pipeline p(in);
//   std::string text;
//   p.grep_string([](const std::string& s){ return s[0] != '#'; })
//    .awk([](std::string_view, const bl::Fields& f, const bl::AwkVars&, std::string& out){
//       out = std::string(f.field(2));
//       return bl::Status::ok();
//     })
//    .read_all_string(text);   // "1\n2\n"
//
// The source is not owned and must outlive the pipeline. One reader at a time.
// To wrap another Pipeline, pass it as a Reader& (Pipeline is not copyable).
class Pipeline : public Reader {
public:
  struct Config {
    char        rs                = '\n';
    std::string fs                = "\\s+";
    std::size_t chunk_bytes       = 64 * 1024;       // scanner growth step
    std::size_t max_record_bytes  = 8 * 1024 * 1024; // 8 MiB guard per record
    int         max_empty_reads   = 100;             // 0 = no limit; raise when the source omits records
    bool        truncate_oversize = false;           // read(): cut records that overflow `cap`
  };

  explicit Pipeline(Reader& src);     // uses default Config{}
  Pipeline(Reader& src, Config cfg);  // throws std::regex_error on a bad cfg.fs
  ~Pipeline() override;

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  // --- settings
  Pipeline& set_rs(char rs);
  Pipeline& set_fs(const std::string& pattern); // throws std::regex_error
  Pipeline& set_fs(std::regex re);

  // --- filters, applied in the order they are added. A record held back by
  // a failed read() (ENOBUFS) also goes through filters added afterwards.
  Pipeline& append(FilterFn fn);
  Pipeline& map(ByteMap fn);
  Pipeline& map_err(ByteMapErr fn);
  Pipeline& map_string(StringMap fn);
  Pipeline& map_string_err(StringMapErr fn);
  Pipeline& grep(BytePredicate pred);
  Pipeline& grep_string(StringPredicate pred);
  Pipeline& grep_regex(std::regex re);
  Pipeline& awk(AwkFn fn);

  // One record per call. An omitted record gives n == 0 with Ok.
  // A record longer than `cap` fails with ENOBUFS and stays queued for the
  // next call, unless Config::truncate_oversize is set.
  // After EndOfStream or an Error every call returns that same status.
  ReadResult read(char* dst, std::size_t cap) override;

  // Like read() without a buffer limit. Returns Ok, Omit (out empty),
  // EndOfStream or Error.
  Status next(std::string& out);

  // --- drain helpers; EndOfStream is reported as Ok
  Status discard();
  Status read_all_slice(std::vector<std::vector<char>>& out);
  Status read_all(std::vector<char>& out);
  Status read_all_slice_string(std::vector<std::string>& out);
  Status read_all_string(std::string& out);

  const AwkVars& vars() const noexcept;
  const PipelineStats& stats() const noexcept;
  const Config& config() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
