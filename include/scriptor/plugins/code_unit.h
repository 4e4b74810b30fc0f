#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <scriptor/core/types.h>
#include <scriptor/plugins/abi.h>

namespace scriptor::plugins {

class PluginApi;

// Registration entrypoint of a code unit; returns SCRIPTOR_PLUGIN_OK on success.
using RegistrationEntry = std::function<int(PluginApi*)>;

/**
 * @brief An executed plugin module.
 *
 * Owns whatever keeps the plugin's code resident (a dlopen handle for the
 * default loader). Destroying the unit releases that code, so every closure
 * the plugin handed out must be destroyed first.
 */
class ICodeUnit {
public:
    virtual ~ICodeUnit() = default;

    /// Namespace this unit was bound to at load time.
    virtual const std::string& unitNamespace() const = 0;

    /// The registration function, or nullopt when the unit does not export one.
    virtual std::optional<RegistrationEntry> registrationEntry() const = 0;

    /// ABI version the unit declares, or nullopt when it declares none.
    virtual std::optional<int> abiVersion() const = 0;
};

/**
 * @brief Resolves an entrypoint file into an executed code unit.
 *
 * Implementations report any failure to bring the code in (unreadable file,
 * unresolved symbols, failing static initialisers) as ErrorCode::ExecutionError.
 */
class ICodeUnitLoader {
public:
    virtual ~ICodeUnitLoader() = default;

    virtual Result<std::unique_ptr<ICodeUnit>> load(const std::filesystem::path& entrypoint,
                                                     const std::string& unitNamespace) = 0;
};

/**
 * Loader backed by the platform's dynamic library facility (dlopen with
 * RTLD_LOCAL, LoadLibrary on Windows). Symbols of one plugin never satisfy
 * lookups from another.
 */
std::unique_ptr<ICodeUnitLoader> makeDynamicCodeUnitLoader();

} // namespace scriptor::plugins
