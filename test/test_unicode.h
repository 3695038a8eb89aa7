#ifndef TEST_UNICODE_H
#define TEST_UNICODE_H

#include "report.h"
#include <aether_unicode.h>

using namespace Aether;

inline bool testUnicode(){
    bool passing = true;

    #define CONTINUATION_CHAR "\x82"
    #define TWO_BYTE_LEAD "\xC3"
    #define THREE_BYTE_LEAD "\xE2"
    #define FOUR_BYTE_LEAD "\xF0"

    passing &= !isIllFormedUtf8("");
    passing &= !isIllFormedUtf8("Set X 1");
    passing &= !isIllFormedUtf8("Set GRÜSSE \"héllo\"");
    passing &= !isIllFormedUtf8("\t\n");
    passing &= !isIllFormedUtf8("Unicode is cool 😎");
    passing &= !isIllFormedUtf8("\xEF\xBF\xBD"); //An encoded replacement character is well formed

    passing &= isIllFormedUtf8("Continuation char without leading byte:" CONTINUATION_CHAR);
    passing &= isIllFormedUtf8("Two continuation chars where one expected:" TWO_BYTE_LEAD CONTINUATION_CHAR CONTINUATION_CHAR);
    passing &= isIllFormedUtf8("No continuation char with end:" TWO_BYTE_LEAD);
    passing &= isIllFormedUtf8("No continuation char with text:" TWO_BYTE_LEAD "normal ASCII");
    passing &= isIllFormedUtf8(THREE_BYTE_LEAD CONTINUATION_CHAR);
    passing &= isIllFormedUtf8(FOUR_BYTE_LEAD CONTINUATION_CHAR CONTINUATION_CHAR "normal ASCII");

    if(!passing) printf("Line %d, ill-formed UTF-8 detection failed\n", __LINE__);

    std::u32string codepoints = toCodepoints("aé😎");
    if(codepoints != U"aé😎"){
        printf("Line %d, decoding produced %zu codepoints\n", __LINE__, codepoints.size());
        passing = false;
    }

    if(toUtf8(codepoints) != "aé😎"){
        printf("Line %d, encoding did not restore the input\n", __LINE__);
        passing = false;
    }

    if(toCodepoints("a" CONTINUATION_CHAR "b") != std::u32string(U"a\uFFFDb")){
        printf("Line %d, stray continuation byte not replaced\n", __LINE__);
        passing = false;
    }

    passing &= isAlpha('_') && isAlpha(U'é') && isAlpha(U'λ') && !isAlpha('1') && !isAlpha('-');
    passing &= isAlphaNumeric('7') && !isAlphaNumeric(U'😎');
    passing &= isLetter(U'ა') && isLetter(U'ক') && isLetter(U'த') && isLetter(U'ሀ') && isLetter(U'𐌰');
    passing &= !isLetter(U'·') && !isLetter(U'×') && !isLetter(U'\u2028');
    passing &= isUpper(U'Ä') && isUpper(U'Ω') && isUpper(U'Ⴀ') && !isUpper(U'ß') && !isUpper(U'ω') && !isUpper(U'ক');
    passing &= isUnicodeNumeric(U'٣') && isUnicodeNumeric(U'²') && !isUnicodeNumeric(U'x') && !isNumeric(U'٣');

    report("UTF-8 handling", passing);
    return passing;
}

#endif // TEST_UNICODE_H
