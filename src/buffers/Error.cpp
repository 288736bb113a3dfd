#include <a2s/buffers/Error.hpp>

namespace a2s {

std::string_view ByteReaderError::message() const {
    switch (m_code) {
        case Code::OutOfBoundsRead: return "ByteReader out of bounds read";
        case Code::UnterminatedString: return "String is missing its NUL terminator";
        case Code::InvalidUtf8: return "String is not valid UTF-8";
    }

    a2s::unreachable();
}

std::string_view ByteWriterError::message() const {
    switch (m_code) {
        case Code::EmbeddedNul: return "Tried encoding a C string that contains a NUL byte";
    }

    a2s::unreachable();
}

}
