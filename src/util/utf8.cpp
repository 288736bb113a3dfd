#include <a2s/util/utf8.hpp>
#include <stddef.h>

namespace a2s {

bool isValidUtf8(std::span<const uint8_t> data) {
    size_t i = 0;

    while (i < data.size()) {
        uint8_t lead = data[i];

        if (lead < 0x80) {
            i++;
            continue;
        }

        size_t len;
        uint32_t cp;

        if ((lead & 0xe0) == 0xc0) {
            len = 2;
            cp = lead & 0x1f;
        } else if ((lead & 0xf0) == 0xe0) {
            len = 3;
            cp = lead & 0x0f;
        } else if ((lead & 0xf8) == 0xf0) {
            len = 4;
            cp = lead & 0x07;
        } else {
            return false;
        }

        if (i + len > data.size()) {
            return false;
        }

        for (size_t j = 1; j < len; j++) {
            uint8_t cont = data[i + j];
            if ((cont & 0xc0) != 0x80) {
                return false;
            }

            cp = (cp << 6) | (cont & 0x3f);
        }

        // reject overlong encodings
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) {
            return false;
        }

        if (cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
            return false;
        }

        i += len;
    }

    return true;
}

}
