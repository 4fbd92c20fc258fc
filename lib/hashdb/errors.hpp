// hashdb: Sparse Merkle tree hash database
// Copyright 2026 The hashdb Authors.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cassert>
#include <string>
#include <system_error>

namespace hashdb
{

/// The closed set of result codes of the hash database operations.
enum ErrorCode : int
{
    SUCCESS = 0,
    DB_KEY_NOT_FOUND,       ///< The requested root or hash is not present in any store tier.
    DB_ERROR,               ///< The durable store failed (transient or permanent).
    INTERNAL_ERROR,         ///< The request was invalid or the engine state is inconsistent.
    SMT_INVALID_DATA_SIZE,  ///< A stored node or value has unexpected size or layout.
};

/// Obtains a reference to the static error category object for hashdb errors.
inline const std::error_category& hashdb_category() noexcept
{
    struct Category : std::error_category
    {
        [[nodiscard]] const char* name() const noexcept final { return "hashdb"; }

        [[nodiscard]] std::string message(int ev) const noexcept final
        {
            switch (ev)
            {
            case SUCCESS:
                return "";
            case DB_KEY_NOT_FOUND:
                return "key not found in database";
            case DB_ERROR:
                return "database error";
            case INTERNAL_ERROR:
                return "internal error";
            case SMT_INVALID_DATA_SIZE:
                return "invalid size of merkle tree node data";
            default:
                assert(false);
                return "Wrong error code";
            }
        }
    };

    static const Category category_instance;
    return category_instance;
}

/// Creates error_code object out of a hashdb error code value.
inline std::error_code make_error_code(ErrorCode errc) noexcept
{
    return {errc, hashdb_category()};
}

/// Maps an error_code coming from any hashdb layer back to the closed ErrorCode set.
/// Errors of foreign categories are reported as DB_ERROR.
inline ErrorCode to_error_code(const std::error_code& ec) noexcept
{
    if (!ec)
        return SUCCESS;
    if (ec.category() != hashdb_category())
        return DB_ERROR;
    return static_cast<ErrorCode>(ec.value());
}

/// The numeric result code used on the wire (the protocol keeps 0 for "unspecified").
inline int wire_code(ErrorCode errc) noexcept
{
    switch (errc)
    {
    case SUCCESS:
        return 1;
    case DB_KEY_NOT_FOUND:
        return 2;
    case DB_ERROR:
        return 3;
    case INTERNAL_ERROR:
        return 4;
    case SMT_INVALID_DATA_SIZE:
        return 14;
    }
    return 0;
}

}  // namespace hashdb
