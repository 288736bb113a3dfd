#pragma once

#include <a2s/util/Error.hpp>

#include <Geode/Result.hpp>

namespace a2s {

A2S_MAKE_ERROR_STRUCT(ByteReaderError,
    OutOfBoundsRead,
    UnterminatedString,
    InvalidUtf8,
);

A2S_MAKE_ERROR_STRUCT(ByteWriterError,
    EmbeddedNul,
);

}
