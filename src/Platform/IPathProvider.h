#pragma once

#include <filesystem>

namespace Platform
{

/// Interface for platform-specific path queries.
class IPathProvider
{
  public:
    virtual ~IPathProvider() = default;

    IPathProvider() = default;
    IPathProvider(const IPathProvider&) = default;
    IPathProvider& operator=(const IPathProvider&) = default;
    IPathProvider(IPathProvider&&) = default;
    IPathProvider& operator=(IPathProvider&&) = default;

    /// Get the user's configuration directory (config.toml lives here).
    /// Linux: $XDG_CONFIG_HOME/portscope, else ~/.config/portscope
    [[nodiscard]] virtual std::filesystem::path getUserConfigDir() const = 0;

    /// Get the directory for state that should survive restarts but is not configuration (the log file).
    /// Linux: $XDG_STATE_HOME/portscope, else ~/.local/state/portscope
    [[nodiscard]] virtual std::filesystem::path getUserStateDir() const = 0;
};

} // namespace Platform
