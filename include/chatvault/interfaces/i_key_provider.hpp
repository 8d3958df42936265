#pragma once
#include "chatvault/core/result.hpp"
#include "chatvault/core/failures.hpp"
#include <cstdint>
#include <functional>
#include <span>
#include <string_view>
namespace chatvault::interfaces {
using chatvault::Result;
using chatvault::Unit;
using chatvault::VaultFailure;

/**
 * @brief Resolves a key_id to a 32-byte symmetric key and lends it to an operation
 *
 * The key never leaves the provider by value: it is only visible inside
 * @p operation, and the provider is free to wipe it afterwards.
 */
class IKeyProvider {
public:
    virtual ~IKeyProvider() = default;
    [[nodiscard]] virtual Result<Unit, VaultFailure> ExecuteWithKey(
        std::string_view key_id,
        std::function<Result<Unit, VaultFailure>(std::span<const uint8_t>)> operation) = 0;
    template<typename T>
    [[nodiscard]] Result<T, VaultFailure> ExecuteWithKeyTyped(
        std::string_view key_id,
        std::function<Result<T, VaultFailure>(std::span<const uint8_t>)> operation) {
        Result<T, VaultFailure> result_holder =
            Result<T, VaultFailure>::Err(VaultFailure::Generic("Key operation not executed"));
        auto wrapper = [&operation, &result_holder](std::span<const uint8_t> key)
            -> Result<Unit, VaultFailure> {
            result_holder = operation(key);
            return result_holder.IsOk()
                ? Result<Unit, VaultFailure>::Ok(Unit{})
                : Result<Unit, VaultFailure>::Err(result_holder.UnwrapErr());
        };
        auto exec_result = ExecuteWithKey(key_id, wrapper);
        if (exec_result.IsErr()) {
            return Result<T, VaultFailure>::Err(exec_result.UnwrapErr());
        }
        return result_holder;
    }
};
}
