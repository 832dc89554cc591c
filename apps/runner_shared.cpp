#include "runner_shared.hpp"

#include "speckle_track/core/utils.hpp"

#include <csignal>

namespace speckle_track::runner {

namespace fs = std::filesystem;

EventTee::EventTee(std::streambuf *console, std::streambuf *file)
    : console_(console), file_(file) {}

int EventTee::overflow(int c) {
  if (traits_type::eq_int_type(c, traits_type::eof()))
    return traits_type::not_eof(c);
  const char ch = traits_type::to_char_type(c);
  return xsputn(&ch, 1) == 1 ? c : traits_type::eof();
}

// The file copy is authoritative; a closed console does not fail the run
std::streamsize EventTee::xsputn(const char *s, std::streamsize n) {
  if (console_)
    console_->sputn(s, n);
  return file_ ? file_->sputn(s, n) : n;
}

int EventTee::sync() {
  if (console_)
    console_->pubsync();
  return (file_ && file_->pubsync() != 0) ? -1 : 0;
}

namespace {

std::atomic<bool> g_stop{false};

void handle_stop_signal(int) { g_stop.store(true); }

} // namespace

std::atomic<bool> &stop_flag() { return g_stop; }

void install_stop_handler() {
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);
}

core::json output_entry(const fs::path &dir, const std::string &name) {
  return {{"file", name}, {"sha256", core::sha256_file(dir / name)}};
}

} // namespace speckle_track::runner
