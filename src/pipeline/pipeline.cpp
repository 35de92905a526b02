#include "byline/pipeline.hpp"
#include "byline/scanner.hpp"
#include <cerrno>
#include <cstring>
#include <utility>

namespace bl {

struct Pipeline::Impl {
  Config cfg;
  std::regex fs_re;
  Scanner scanner;
  FilterChain chain;
  AwkVars vars;
  PipelineStats stats;

  std::string record;       // scratch for the chain
  std::string pending;      // produced but not yet handed to read()
  bool has_pending{false};
  bool finished{false};
  Status final_status;

  Impl(Reader& src, Config c)
    : cfg(std::move(c)),
      fs_re(cfg.fs),
      scanner(src, Scanner::Config{cfg.chunk_bytes, cfg.max_record_bytes, cfg.max_empty_reads}) {
    vars.rs = cfg.rs;
    vars.fs = cfg.fs;
    vars.fs_re = &fs_re;
  }

  Status finish(Status s) {
    finished = true;
    final_status = std::move(s);
    return final_status;
  }

  Status next(std::string& out) {
    if (has_pending) {
      out.swap(pending);
      pending.clear();
      has_pending = false;
      return Status::ok();
    }
    if (finished) { out.clear(); return final_status; }

    std::string_view tok;
    if (!scanner.scan(vars.rs, tok)) {
      out.clear();
      const Status& s = scanner.status();
      return finish(s.is_error() ? s : Status::eof());
    }

    ++vars.nr;
    ++stats.records_in;
    stats.bytes_in += tok.size();

    record.assign(tok.data(), tok.size());
    Status s = chain.apply(record);
    if (s.is_omit()) {
      ++stats.records_omitted;
      out.clear();
      return s;
    }
    if (!s.is_ok()) {
      out.clear();
      return finish(std::move(s));
    }

    ++stats.records_out;
    stats.bytes_out += record.size();
    out.swap(record);
    return Status::ok();
  }

  ReadResult read(char* dst, std::size_t cap) {
    if (!has_pending) {
      Status s = next(pending);
      if (s.is_omit()) return {0, Status::ok()};
      if (!s.is_ok()) return {0, s};
      has_pending = true;
    }

    std::size_t n = pending.size();
    if (n > cap) {
      if (!cfg.truncate_oversize) {
        return {0, Status::error("record of " + std::to_string(n) +
                                 " bytes does not fit a read buffer of " +
                                 std::to_string(cap) + " bytes", ENOBUFS)};
      }
      n = cap;
    }
    if (n) std::memcpy(dst, pending.data(), n);
    pending.clear();
    has_pending = false;
    return {n, Status::ok()};
  }

  // A filter added while a record waits in `pending` runs on that record
  // too, so the drain helpers' collectors see it.
  void append(FilterFn fn) {
    chain.append(fn);
    if (!has_pending) return;

    stats.bytes_out -= pending.size();
    Status s = fn(pending);
    if (s.is_ok()) {
      stats.bytes_out += pending.size();
      return;
    }
    pending.clear();
    has_pending = false;
    --stats.records_out;
    if (s.is_omit()) {
      ++stats.records_omitted;
      return;
    }
    finish(std::move(s));
  }

  // Drain through next(); collecting filters installed by the read_all_*
  // helpers never run again afterwards since the pipeline is finished.
  Status drain() {
    std::string sink;
    while (true) {
      Status s = next(sink);
      if (s.is_ok() || s.is_omit()) continue;
      return s.is_eof() ? Status::ok() : s;
    }
  }
};

Pipeline::Pipeline(Reader& src) : Pipeline(src, Config{}) {}

Pipeline::Pipeline(Reader& src, Config cfg) : p_(new Impl(src, std::move(cfg))) {}

Pipeline::~Pipeline() { delete p_; }

Pipeline& Pipeline::set_rs(char rs) {
  p_->cfg.rs = rs;
  p_->vars.rs = rs;
  return *this;
}

Pipeline& Pipeline::set_fs(const std::string& pattern) {
  std::regex re(pattern);
  p_->fs_re = std::move(re);
  p_->cfg.fs = pattern;
  p_->vars.fs = p_->cfg.fs;
  return *this;
}

Pipeline& Pipeline::set_fs(std::regex re) {
  p_->fs_re = std::move(re);
  p_->cfg.fs.clear();
  p_->vars.fs = p_->cfg.fs;
  return *this;
}

Pipeline& Pipeline::append(FilterFn fn) {
  p_->append(std::move(fn));
  return *this;
}

Pipeline& Pipeline::map(ByteMap fn) { return append(filters::map(std::move(fn))); }
Pipeline& Pipeline::map_err(ByteMapErr fn) { return append(filters::map_err(std::move(fn))); }
Pipeline& Pipeline::map_string(StringMap fn) { return append(filters::map_string(std::move(fn))); }
Pipeline& Pipeline::map_string_err(StringMapErr fn) { return append(filters::map_string_err(std::move(fn))); }
Pipeline& Pipeline::grep(BytePredicate pred) { return append(filters::grep(std::move(pred))); }
Pipeline& Pipeline::grep_string(StringPredicate pred) { return append(filters::grep_string(std::move(pred))); }
Pipeline& Pipeline::grep_regex(std::regex re) { return append(filters::grep_regex(std::move(re))); }

Pipeline& Pipeline::awk(AwkFn fn) {
  Impl* p = p_;
  return map_string_err([p, fn = std::move(fn)](const std::string& in, std::string& out) {
    const char rs = p->vars.rs;
    std::string_view line(in);
    bool add_rs = false;
    if (!line.empty() && line.back() == rs) {
      add_rs = true;
      line.remove_suffix(1);
    }

    Fields fields(line, split_fields(line, p->fs_re));
    p->vars.nf = fields.size();

    const AwkVars snapshot = p->vars;
    Status s = fn(line, fields, snapshot, out);
    if (!s.is_ok()) {
      out.clear();
      return s;
    }

    if (add_rs && (out.empty() || out.back() != rs)) out.push_back(rs);
    return Status::ok();
  });
}

ReadResult Pipeline::read(char* dst, std::size_t cap) { return p_->read(dst, cap); }

Status Pipeline::next(std::string& out) { return p_->next(out); }

Status Pipeline::discard() { return p_->drain(); }

Status Pipeline::read_all_slice(std::vector<std::vector<char>>& out) {
  out.clear();
  return map([&out](std::string_view line) {
    out.emplace_back(line.begin(), line.end());
    return std::string();
  }).discard();
}

Status Pipeline::read_all(std::vector<char>& out) {
  out.clear();
  return map([&out](std::string_view line) {
    out.insert(out.end(), line.begin(), line.end());
    return std::string();
  }).discard();
}

Status Pipeline::read_all_slice_string(std::vector<std::string>& out) {
  out.clear();
  return map_string([&out](const std::string& line) {
    out.push_back(line);
    return std::string();
  }).discard();
}

Status Pipeline::read_all_string(std::string& out) {
  out.clear();
  return map_string([&out](const std::string& line) {
    out += line;
    return std::string();
  }).discard();
}

const AwkVars& Pipeline::vars() const noexcept { return p_->vars; }
const PipelineStats& Pipeline::stats() const noexcept { return p_->stats; }
const Pipeline::Config& Pipeline::config() const noexcept { return p_->cfg; }

}
