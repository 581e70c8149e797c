#include "engine_factory.hpp"

#include "cli_engine.hpp"
#include "lan_engine.hpp"

#ifdef CHUNKSCRIBE_WITH_WHISPER
#include "whisper_lib_engine.hpp"
#endif

#include <filesystem>

std::expected<std::unique_ptr<EngineAdapter>, Error> make_engine(const Config& config) {
    const auto& e = config.engine;

    if (e.type == "lan") {
        return std::make_unique<LanEngine>(e.url, e.api_format, e.request_timeout_seconds);
    }
    if (e.type == "cli") {
        return std::make_unique<CliEngine>(e.executable, e.model_path, config.resolved_threads(),
                                           std::filesystem::path(config.media.temp_dir) / "engine");
    }
    if (e.type == "library") {
#ifdef CHUNKSCRIBE_WITH_WHISPER
        return std::make_unique<WhisperLibEngine>(e.model_path, config.resolved_threads());
#else
        return std::unexpected(Error{ErrorKind::Configuration,
            "engine type 'library' requires a build with CHUNKSCRIBE_WITH_WHISPER=ON"});
#endif
    }
    return std::unexpected(Error{ErrorKind::Configuration, "unknown engine type: " + e.type});
}
