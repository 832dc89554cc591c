#pragma once

#include "speckle_track/core/events.hpp"
#include "speckle_track/core/types.hpp"

#include <atomic>
#include <filesystem>
#include <streambuf>
#include <string>

namespace speckle_track::runner {

// Mirrors the JSON-lines event stream to the console and to events.jsonl
class EventTee : public std::streambuf {
public:
  EventTee(std::streambuf *console, std::streambuf *file);

protected:
  int overflow(int c) override;
  std::streamsize xsputn(const char *s, std::streamsize n) override;
  int sync() override;

private:
  std::streambuf *console_;
  std::streambuf *file_;
};

// Set by SIGINT/SIGTERM once install_stop_handler() has run
std::atomic<bool> &stop_flag();
void install_stop_handler();

// {"file": name, "sha256": hash} for an output written into dir
core::json output_entry(const std::filesystem::path &dir, const std::string &name);

} // namespace speckle_track::runner
