#pragma once

#include "voxkey/voxkey.h"
#include "voxkey/hotkey_backend.hpp"
#include "voxkey/inference_service.hpp"
#include "voxkey/model_resolver.hpp"

#include <functional>
#include <memory>
#include <vector>

// C++ side of the C interface: lets a host replace the default collaborators
// of the process-wide engine and keyboard monitor. Install factories before
// the first C call that needs them.

namespace voxkey {

using InferenceServiceFactory = std::function<std::unique_ptr<InferenceService>()>;
using ModelResolverFactory = std::function<std::unique_ptr<ModelResolver>()>;
using HotkeyBackendFactory = std::function<std::vector<std::unique_ptr<HotkeyBackend>>()>;

// Empty factories restore the defaults (whisper.cpp, XDG model locations
// with libcurl download, backends from the config file)
void set_inference_service_factory(InferenceServiceFactory factory);
void set_model_resolver_factory(ModelResolverFactory factory);
void set_hotkey_backend_factory(HotkeyBackendFactory factory);

// Destroys the process-wide engine. The next C call builds a new one from
// the installed factories.
void release_engine();

} // namespace voxkey
