#include <catch2/catch_all.hpp>
#include "ZXCharset.hpp"

using namespace zxbasic;
using namespace zxbasic::ZXCharset;

TEST_CASE("ZX charset byte to text", "[charset]") {
    SECTION("Printable ASCII is unchanged") {
        REQUIRE(byteToText('A', false) == "A");
        REQUIRE(byteToText(' ', false) == " ");
        REQUIRE(byteToText('~', false) == "~");
    }

    SECTION("Symbols depend on the unicode option") {
        REQUIRE(byteToText(POUND, false) == "`");
        REQUIRE(byteToText(POUND, true) == "\xC2\xA3");
        REQUIRE(byteToText(UP_ARROW, false) == "^");
        REQUIRE(byteToText(UP_ARROW, true) == "\xE2\x86\x91");
        REQUIRE(byteToText(COPYRIGHT, false) == "{(C)}");
        REQUIRE(byteToText(COPYRIGHT, true) == "\xC2\xA9");
    }

    SECTION("Block graphics") {
        REQUIRE(byteToText(0x80, false) == "\xC2\xA0");
        REQUIRE(byteToText(0x8F, false) == "\xE2\x96\x88");
        REQUIRE(byteToText(0x83, false) == "\xE2\x96\x80");
        REQUIRE(isBlockGraphic(0x85));
        REQUIRE_FALSE(isBlockGraphic(0x90));
    }

    SECTION("User defined graphics") {
        REQUIRE(byteToText(0x90, false) == "{UDG:00}");
        REQUIRE(byteToText(0xA2, false) == "{UDG:18}");
        REQUIRE(isUdg(0x9A));
    }

    SECTION("Control codes") {
        REQUIRE(byteToText(0x01, false) == "?");
        REQUIRE(byteToText(0x10, true) == "?");
    }
}

TEST_CASE("ZX charset text to byte", "[charset]") {
    uint8_t out = 0;

    SECTION("Escapes") {
        REQUIRE(textToByte("{(C)} 1982", 0, out) == 5);
        REQUIRE(out == COPYRIGHT);

        REQUIRE(textToByte("x{UDG:07}", 1, out) == 8);
        REQUIRE(out == 0x97);
    }

    SECTION("Malformed escapes are plain text") {
        REQUIRE(textToByte("{UDG:19}", 0, out) == 0);
        REQUIRE(textToByte("{UDG:1}", 0, out) == 0);
        REQUIRE(textToByte("{C}", 0, out) == 0);
    }

    SECTION("UTF-8 symbols and blocks") {
        REQUIRE(textToByte("\xC2\xA3" "5", 0, out) == 2);
        REQUIRE(out == POUND);

        REQUIRE(textToByte("\xE2\x96\x9D", 0, out) == 3);
        REQUIRE(out == 0x81);
    }

    SECTION("Plain ASCII is not consumed") {
        REQUIRE(textToByte("A", 0, out) == 0);
        REQUIRE(textToByte("", 0, out) == 0);
    }

    SECTION("Every graphic survives a round trip") {
        for (int byte = FIRST_BLOCK_GRAPHIC; byte <= LAST_UDG; byte++) {
            std::string text = byteToText(static_cast<uint8_t>(byte), false);
            uint8_t back = 0;
            REQUIRE(textToByte(text, 0, back) == text.size());
            REQUIRE(back == byte);
        }
    }
}
