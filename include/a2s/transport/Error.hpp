#pragma once

#include <a2s/util/Error.hpp>
#include <a2s/buffers/Error.hpp>
#include <qsox/Error.hpp>
#include <qsox/Resolver.hpp>

#include <string>
#include <string_view>
#include <variant>

// Errors produced while querying a server

namespace a2s {

using ResolverError = qsox::resolver::Error;

struct QueryError {
    typedef enum {
        TimedOut,
        MalformedPacket,
        ReassemblyMismatch,
        DuplicateFragment,
        InvalidSplitHeader,
        InvalidMarker,
        CompressedResponse,
        ChallengeError,
        UnexpectedHeader,
        ZeroLengthMessage,
        DatagramTooLarge,
        InvalidEndpoint,
    } CustomCode;

    struct CustomKind {
        CustomCode code;

        std::string_view message() const;

        bool operator==(const CustomKind& other) const = default;
        bool operator!=(const CustomKind& other) const = default;
    };

    QueryError(const qsox::Error& err);
    QueryError(ResolverError err) : m_kind(std::move(err)) {}
    QueryError(ByteReaderError err) : m_kind(std::move(err)) {}
    QueryError(ByteWriterError err) : m_kind(std::move(err)) {}
    QueryError(CustomCode code) : m_kind(CustomKind{code}) {}

    bool operator==(const QueryError& other) const = default;
    bool operator!=(const QueryError& other) const = default;

    /// True if this is the given engine error code.
    bool is(CustomCode code) const;
    bool isTimeout() const;

    std::variant<
        qsox::Error,
        ResolverError,
        ByteReaderError,
        ByteWriterError,
        CustomKind
    > m_kind;

    std::string message() const;
};

template <typename T = void>
using QueryResult = geode::Result<T, QueryError>;

}
