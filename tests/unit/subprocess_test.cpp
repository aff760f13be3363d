#include "internal/process/subprocess.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

namespace {

using slideshow::process::FindExecutable;
using slideshow::process::RunProcess;
using slideshow::process::SpawnError;
using namespace std::chrono_literals;

void TestExitCodeAndMergedOutput() {
  auto result = RunProcess({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"}, 5000ms);
  assert(!result.timed_out);
  assert(result.exit_code == 3);
  assert(result.diagnostics.find("out") != std::string::npos);
  assert(result.diagnostics.find("err") != std::string::npos);
}

void TestSuccessfulRun() {
  auto result = RunProcess({"/bin/sh", "-c", "exit 0"}, 5000ms);
  assert(result.exit_code == 0);
  assert(!result.timed_out);
}

void TestArgumentsAreNotShellExpanded() {
  auto result = RunProcess({"/bin/sh", "-c", "printf '%s' \"$1\"", "sh", "a b;$HOME"}, 5000ms);
  assert(result.exit_code == 0);
  assert(result.diagnostics == "a b;$HOME");
}

void TestTimeoutKillsChild() {
  const auto started = std::chrono::steady_clock::now();
  auto       result  = RunProcess({"/bin/sh", "-c", "sleep 30"}, 200ms);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  assert(result.timed_out);
  assert(result.exit_code != 0);
  assert(elapsed < 10s);
}

void TestChildOutlivingItsOutputIsAwaited() {
  const auto started = std::chrono::steady_clock::now();
  auto result = RunProcess({"/bin/sh", "-c", "echo closing; exec 1>&- 2>&-; sleep 0.5; exit 3"}, 5000ms);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  assert(!result.timed_out);
  assert(result.exit_code == 3);
  assert(result.diagnostics.find("closing") != std::string::npos);
  assert(elapsed >= 400ms);
}

void TestDeadlineCoversChildAfterOutputCloses() {
  auto result = RunProcess({"/bin/sh", "-c", "exec 1>&- 2>&-; sleep 30"}, 300ms);
  assert(result.timed_out);
  assert(result.exit_code != 0);
}

void TestBackgroundDescendantDoesNotDelayExit() {
  // the backgrounded sleep keeps the output pipe open after sh exits
  const auto started = std::chrono::steady_clock::now();
  auto       result  = RunProcess({"/bin/sh", "-c", "sleep 5 & echo done; exit 0"}, 10000ms);
  const auto elapsed = std::chrono::steady_clock::now() - started;

  assert(!result.timed_out);
  assert(result.exit_code == 0);
  assert(elapsed < 4s);
}

void TestDiagnosticsKeepOnlyTheTail() {
  // ~200 KiB of output; only the last 64 KiB survive
  auto result = RunProcess({"/bin/sh", "-c", "i=0; while [ $i -lt 4000 ]; do "
                                             "echo 'xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx'; "
                                             "i=$((i+1)); done; echo last-line"},
                           30000ms);
  assert(result.exit_code == 0);
  assert(result.diagnostics.size() == slideshow::process::kDiagnosticTailBytes);
  assert(result.diagnostics.find("last-line") != std::string::npos);
}

void TestMissingBinaryRaisesSpawnError() {
  bool threw = false;
  try {
    (void)RunProcess({"slideshow-definitely-not-installed"}, 1000ms);
  } catch (const SpawnError& e) {
    threw = true;
    assert(e.error_number() != 0);
  }
  assert(threw);
}

void TestFindExecutable() {
  auto sh = FindExecutable("sh");
  assert(sh.has_value());
  assert(sh->find('/') != std::string::npos);

  assert(FindExecutable("/bin/sh").has_value());
  assert(!FindExecutable("slideshow-definitely-not-installed").has_value());
  assert(!FindExecutable("/nonexistent/ffmpeg").has_value());
  assert(!FindExecutable("").has_value());
}

} // namespace

int main() {
  TestExitCodeAndMergedOutput();
  TestSuccessfulRun();
  TestArgumentsAreNotShellExpanded();
  TestTimeoutKillsChild();
  TestChildOutlivingItsOutputIsAwaited();
  TestDeadlineCoversChildAfterOutputCloses();
  TestBackgroundDescendantDoesNotDelayExit();
  TestDiagnosticsKeepOnlyTheTail();
  TestMissingBinaryRaisesSpawnError();
  TestFindExecutable();

  std::cout << "slideshow_unit_subprocess: pass\n";
  return 0;
}
