#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <simdjson.h>

namespace fs = std::filesystem;

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream o; o << in.rdbuf();
  return o.str();
}

static int run(const std::string& cmd) {
  int rc = std::system(cmd.c_str());
  if (rc == -1) return -1;
  return WIFEXITED(rc) ? WEXITSTATUS(rc) : -1;
}

int main() {
  const std::string bin = env_or("BYLINE_BIN", "build/byline");
  const fs::path events = "tests/data/events.log";
  const fs::path tail   = "tests/data/no_trailing_sep.txt";
  if (!fs::exists(bin))    { std::cerr << "[ERR] binary not found: " << bin << "\n"; return 2; }
  if (!fs::exists(events)) { std::cerr << "[ERR] missing: " << events << "\n"; return 2; }
  if (!fs::exists(tail))   { std::cerr << "[ERR] missing: " << tail << "\n"; return 2; }

  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path work = fs::temp_directory_path() / ("byline-it-" + std::to_string(stamp));
  fs::create_directories(work);
  const fs::path out1 = work / "grep.txt";
  const fs::path runjson = work / "stats" / "run.json";

  bool ok = true;

  // grep + field selection + stats
  std::string cmd = "'" + bin + "' --quiet --grep=ERROR --fields=1,3 --ofs=, "
                    "--stats='" + runjson.string() + "' '" + events.string() + "'"
                    " > '" + out1.string() + "'";
  int rc = run(cmd);
  if (rc != 0) { std::cerr << "[FAIL] grep run returned " << rc << "\n"; return 1; }

  const std::string got1 = slurp(out1);
  if (got1 != "2024-05-01,disk\n2024-05-02,net\n") {
    std::cerr << "[FAIL] grep output:\n" << got1 << "\n"; ok = false;
  }

  if (!fs::exists(runjson)) { std::cerr << "[FAIL] no run.json at " << runjson << "\n"; return 1; }
  simdjson::ondemand::parser p;
  auto json = simdjson::padded_string::load(runjson.string());
  simdjson::ondemand::document doc;
  if (json.error() || p.iterate(json.value_unsafe()).get(doc)) {
    std::cerr << "[FAIL] run.json does not parse\n"; return 1;
  }
  std::uint64_t rin = 0, rout = 0, romit = 0;
  std::string_view status;
  if (doc["records_in"].get_uint64().get(rin) || rin != 6) { std::cerr << "[FAIL] records_in=" << rin << "\n"; ok = false; }
  if (doc["records_out"].get_uint64().get(rout) || rout != 2) { std::cerr << "[FAIL] records_out=" << rout << "\n"; ok = false; }
  if (doc["records_omitted"].get_uint64().get(romit) || romit != 4) { std::cerr << "[FAIL] records_omitted=" << romit << "\n"; ok = false; }
  if (doc["status"].get_string().get(status) || status != "ok") { std::cerr << "[FAIL] status=" << status << "\n"; ok = false; }

  // case mapping + numbering, unterminated last record
  const fs::path out2 = work / "upper.txt";
  rc = run("'" + bin + "' --quiet --upper --number '" + tail.string() + "' > '" + out2.string() + "'");
  const std::string got2 = slurp(out2);
  if (rc != 0 || got2 != "1\tALPHA 1\n2\tBETA 2\n3\tGAMMA 3") {
    std::cerr << "[FAIL] upper/number rc=" << rc << " output:\n" << got2 << "\n"; ok = false;
  }

  // stdin + custom record separator
  const fs::path out3 = work / "rs.txt";
  rc = run("printf 'a b;c d;e' | '" + bin + "' --quiet --rs=';' --fields=2 > '" + out3.string() + "'");
  const std::string got3 = slurp(out3);
  if (rc != 0 || got3 != "b;d;") {
    std::cerr << "[FAIL] stdin/rs rc=" << rc << " output: " << got3 << "\n"; ok = false;
  }

  // stdin is streamed: the first record is out while the writer still sleeps
  const fs::path out4 = work / "live.txt";
  const fs::path snap = work / "live_snapshot.txt";
  rc = run("( printf 'first\\n'; sleep 3; printf 'second\\n' ) | '" + bin +
           "' --quiet --line-buffered > '" + out4.string() + "' & sleep 1; cp '" +
           out4.string() + "' '" + snap.string() + "'; wait");
  const std::string early = slurp(snap);
  const std::string late = slurp(out4);
  if (rc != 0 || early != "first\n" || late != "first\nsecond\n") {
    std::cerr << "[FAIL] streaming rc=" << rc << " after 1s: '" << early
              << "' final: '" << late << "'\n"; ok = false;
  }

  // usage errors and missing input
  rc = run("'" + bin + "' --quiet --grep='(' '" + events.string() + "' > /dev/null 2>&1");
  if (rc != 2) { std::cerr << "[FAIL] bad pattern exit code " << rc << "\n"; ok = false; }
  rc = run("'" + bin + "' --quiet '" + (work / "nope.txt").string() + "' > /dev/null 2>&1");
  if (rc != 3) { std::cerr << "[FAIL] missing input exit code " << rc << "\n"; ok = false; }

  std::error_code ec;
  fs::remove_all(work, ec);

  if (!ok) return 1;
  std::cout << "[PASS] byline cli end to end\n";
  return 0;
}
