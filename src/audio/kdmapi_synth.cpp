// src/audio/kdmapi_synth.cpp

#include "audio/kdmapi_synth.hpp"

#include <stdexcept>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <dlfcn.h>
#endif

#include "common/logger.hpp"

namespace audio {
namespace {

#ifdef _WIN32
constexpr const char *kLibraryName = "OmniMIDI.dll";

void *open_library() { return LoadLibraryA(kLibraryName); }
void *find_symbol(void *lib, const char *name) {
  return reinterpret_cast<void *>(
      GetProcAddress(static_cast<HMODULE>(lib), name));
}
void close_library(void *lib) { FreeLibrary(static_cast<HMODULE>(lib)); }
#else
constexpr const char *kLibraryName = "libOmniMIDI.so";

void *open_library() { return dlopen(kLibraryName, RTLD_NOW | RTLD_LOCAL); }
void *find_symbol(void *lib, const char *name) { return dlsym(lib, name); }
void close_library(void *lib) { dlclose(lib); }
#endif

template <typename Fn> Fn require(void *lib, const char *name) {
  void *sym = find_symbol(lib, name);
  if (sym == nullptr) {
    close_library(lib);
    throw std::runtime_error(std::string(kLibraryName) + " has no " + name);
  }
  return reinterpret_cast<Fn>(sym);
}

} // namespace

KdmapiSynth::KdmapiSynth() {
  library_ = open_library();
  if (library_ == nullptr)
    throw std::runtime_error(std::string("Failed to load ") + kLibraryName);

  initialize_ = require<InitializeFn>(library_, "InitializeKDMAPIStream");
  terminate_ = require<TerminateFn>(library_, "TerminateKDMAPIStream");
  resetStream_ = require<ResetFn>(library_, "ResetKDMAPIStream");
  sendDirectData_ = require<SendDirectDataFn>(library_, "SendDirectData");

  if (!initialize_()) {
    close_library(library_);
    throw std::runtime_error("Failed to initialize KDMAPI");
  }
  logging::info("kdmapi: stream initialized");
}

KdmapiSynth::~KdmapiSynth() {
  if (!terminate_())
    logging::warning("kdmapi: stream did not terminate cleanly");
  close_library(library_);
}

bool KdmapiSynth::push_event(std::uint32_t raw) {
  sendDirectData_(raw);
  return true;
}

void KdmapiSynth::reset() {
  // All Sound Off + Reset All Controllers first, then the stream reset
  for (std::uint32_t ch = 0; ch < 16; ++ch) {
    sendDirectData_((0xB0 | ch) | (120 << 8));
    sendDirectData_((0xB0 | ch) | (121 << 8));
  }
  resetStream_();
}

void KdmapiSynth::set_layer_count(std::optional<std::size_t>) {
  // OmniMIDI's own configuration decides layering
}

void KdmapiSynth::set_soundfont(const std::filesystem::path &) {
  // OmniMIDI's own configuration lists the soundfonts
}

} // namespace audio
