#pragma once

#include "app/app.hpp" // IWYU pragma: export
#include "sandbox/sandbox_backend.hpp"
#include "user/program_options.hpp"

#include <memory>

namespace assessgrader {

/// Loads definitions, wires the engine together and serves it over HTTP until stopped
class ServerApp final : public App
{
public:
    using App::App;

    /// Stop a running server from a signal handler thread
    static void request_shutdown();

private:
    int run_impl() override;

    std::shared_ptr<SandboxBackend> make_backend(ProgramOptions::BackendKind kind) const;
};

} // namespace assessgrader
