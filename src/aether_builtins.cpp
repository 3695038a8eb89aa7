#include "aether_builtins.h"

#include <spdlog/fmt/fmt.h>

namespace Aether {

namespace Code {

static const std::vector<Builtin> builtin_catalog = {
    //IO
    {"PRINTLN", "PRINTLN(value...)", "Print values to the console followed by a newline", "IO",
        {"PRINTLN(\"Hello World\")", "PRINTLN(MY_VAR, MY_VAR2)"}},
    {"PRINT", "PRINT(value...)", "Print values to the console without a newline", "IO",
        {"PRINT(\"Result: \")", "PRINT(RESULT)"}},
    {"INPUT", "INPUT(prompt)", "Read a line of user input", "IO",
        {"Set NAME INPUT(\"Enter your name: \")"}},

    //Array
    {"MAP", "MAP(array, function)", "Apply a function to every element of an array", "Array",
        {"Set DOUBLED MAP(NUMBERS, Lambda X -> (X * 2))"}},
    {"FILTER", "FILTER(array, predicate)", "Keep the array elements matching a predicate", "Array",
        {"Set EVENS FILTER(NUMBERS, Lambda X -> ((X % 2) == 0))"}},
    {"REDUCE", "REDUCE(array, function, initial)", "Fold an array into a single value", "Array",
        {"Set SUM REDUCE(NUMBERS, Lambda (ACC, X) -> (ACC + X), 0)"}},
    {"LENGTH", "LENGTH(array_or_string)", "Return the length of an array or string", "Array",
        {"Set LEN LENGTH([1, 2, 3])", "Set STR_LEN LENGTH(\"hello\")"}},
    {"PUSH", "PUSH(array, element)", "Append an element to the end of an array", "Array",
        {"PUSH(MY_ARR, 42)"}},
    {"POP", "POP(array)", "Remove and return the last element of an array", "Array",
        {"Set LAST POP(MY_ARR)"}},
    {"SORT", "SORT(array)", "Sort an array in ascending order", "Array",
        {"Set SORTED SORT([3, 1, 4, 1, 5])"}},
    {"REVERSE", "REVERSE(array)", "Reverse an array", "Array",
        {"Set REVERSED REVERSE([1, 2, 3])"}},
    {"JOIN", "JOIN(array, separator)", "Join array elements into a string with a separator", "Array",
        {"Set CSV JOIN([\"a\", \"b\", \"c\"], \",\")"}},
    {"RANGE", "RANGE(start, end)", "Generate an array of numbers in a range", "Array",
        {"Set NUMS RANGE(1, 10)"}},
    {"SUM", "SUM(array)", "Sum the elements of an array", "Array",
        {"Set TOTAL SUM([1, 2, 3, 4, 5])"}},
    {"MIN", "MIN(array)", "Return the smallest element of an array", "Array",
        {"Set MINIMUM MIN([3, 1, 4, 1, 5])"}},
    {"MAX", "MAX(array)", "Return the largest element of an array", "Array",
        {"Set MAXIMUM MAX([3, 1, 4, 1, 5])"}},

    //String
    {"SPLIT", "SPLIT(string, separator)", "Split a string into an array", "String",
        {"Set PARTS SPLIT(\"a,b,c\", \",\")"}},
    {"UPPER", "UPPER(string)", "Convert to upper case", "String",
        {"Set UPPER UPPER(\"hello\")"}},
    {"LOWER", "LOWER(string)", "Convert to lower case", "String",
        {"Set LOWER LOWER(\"HELLO\")"}},
    {"TRIM", "TRIM(string)", "Strip leading and trailing whitespace", "String",
        {"Set TRIMMED TRIM(\" hello \")"}},
    {"REPLACE", "REPLACE(string, old, new)", "Replace occurrences of a substring", "String",
        {"Set REPLACED REPLACE(\"hello\", \"l\", \"r\")"}},
    {"STARTSWITH", "STARTSWITH(string, prefix)", "Check whether a string starts with a prefix", "String",
        {"Set IS_PREFIX STARTSWITH(\"hello\", \"he\")"}},
    {"ENDSWITH", "ENDSWITH(string, suffix)", "Check whether a string ends with a suffix", "String",
        {"Set IS_SUFFIX ENDSWITH(\"hello\", \"lo\")"}},
    {"SUBSTRING", "SUBSTRING(string, start, length)", "Extract a substring", "String",
        {"Set SUB SUBSTRING(\"hello\", 1, 3)"}},
    {"FORMAT", "FORMAT(template, args...)", "Format a string", "String",
        {"Set MSG FORMAT(\"Hello {}, you are {} years old\", NAME, AGE)"}},

    //Math
    {"ABS", "ABS(number)", "Return the absolute value", "Math",
        {"Set ABSOLUTE ABS(-5)"}},
    {"FLOOR", "FLOOR(number)", "Round down", "Math",
        {"Set FLOORED FLOOR(3.7)"}},
    {"CEIL", "CEIL(number)", "Round up", "Math",
        {"Set CEILED CEIL(3.2)"}},
    {"ROUND", "ROUND(number)", "Round to the nearest integer", "Math",
        {"Set ROUNDED ROUND(3.5)"}},
    {"SQRT", "SQRT(number)", "Compute the square root", "Math",
        {"Set ROOT SQRT(16)"}},
    {"POW", "POW(base, exponent)", "Raise a base to a power", "Math",
        {"Set POWER POW(2, 3)"}},
    {"LOG", "LOG(number)", "Compute the natural logarithm", "Math",
        {"Set LN LOG(2.718)"}},
    {"LOG10", "LOG10(number)", "Compute the base 10 logarithm", "Math",
        {"Set LG LOG10(100)"}},
    {"SIN", "SIN(radians)", "Compute the sine", "Math",
        {"Set SINE SIN(1.57)"}},
    {"COS", "COS(radians)", "Compute the cosine", "Math",
        {"Set COSINE COS(0)"}},
    {"TAN", "TAN(radians)", "Compute the tangent", "Math",
        {"Set TANGENT TAN(0.785)"}},
    {"RANDOM", "RANDOM()", "Generate a random number between 0 and 1", "Math",
        {"Set RAND RANDOM()"}},

    //Type
    {"TYPE", "TYPE(value)", "Return the type of a value as a string", "Type",
        {"Set T TYPE(42)"}},
    {"STRING", "STRING(value)", "Convert to a string", "Type",
        {"Set STR STRING(42)"}},
    {"NUMBER", "NUMBER(string_or_value)", "Convert to a number", "Type",
        {"Set NUM NUMBER(\"42\")"}},
    {"ISNUMBER", "ISNUMBER(value)", "Check whether a value is a number", "Type",
        {"Set IS_NUM ISNUMBER(42)"}},
    {"ISSTRING", "ISSTRING(value)", "Check whether a value is a string", "Type",
        {"Set IS_STR ISSTRING(\"hello\")"}},
    {"ISARRAY", "ISARRAY(value)", "Check whether a value is an array", "Type",
        {"Set IS_ARR ISARRAY([1, 2])"}},
    {"ISDICT", "ISDICT(value)", "Check whether a value is a dict", "Type",
        {"Set IS_DICT ISDICT({\"key\": \"value\"})"}},

    //Dict
    {"KEYS", "KEYS(dict)", "Return all keys of a dict", "Dict",
        {"Set ALL_KEYS KEYS(MY_DICT)"}},
    {"VALUES", "VALUES(dict)", "Return all values of a dict", "Dict",
        {"Set ALL_VALUES VALUES(MY_DICT)"}},
    {"ITEMS", "ITEMS(dict)", "Return the key value pairs of a dict", "Dict",
        {"Set PAIRS ITEMS(MY_DICT)"}},
    {"HASKEY", "HASKEY(dict, key)", "Check whether a dict contains a key", "Dict",
        {"Set HAS HASKEY(MY_DICT, \"name\")"}},

    //JSON
    {"JSONPARSE", "JSONPARSE(json_string)", "Parse a JSON string", "JSON",
        {"Set DATA JSONPARSE(\"{\\\"name\\\": \\\"Alice\\\"}\")"}},
    {"JSONSTRINGIFY", "JSONSTRINGIFY(value)", "Convert a value to a JSON string", "JSON",
        {"Set JSON JSONSTRINGIFY(MY_DATA)"}},

    //DateTime
    {"NOW", "NOW()", "Return the current timestamp", "DateTime",
        {"Set TIMESTAMP NOW()"}},
    {"FORMATDATE", "FORMATDATE(timestamp, format)", "Format a timestamp", "DateTime",
        {"Set DATE_STR FORMATDATE(NOW(), \"%Y-%m-%d\")"}},
    {"SLEEP", "SLEEP(seconds)", "Pause execution for a number of seconds", "DateTime",
        {"SLEEP(1)"}},
};

static AETHER_UNORDERED_MAP<std::string_view, size_t> buildLookup() alloc_except {
    AETHER_UNORDERED_MAP<std::string_view, size_t> lookup;
    for(size_t i = 0; i < builtin_catalog.size(); i++)
        lookup[builtin_catalog[i].name] = i;

    return lookup;
}

static AETHER_STATIC_MAP<std::string_view, size_t> builtin_lookup = buildLookup();

std::string Builtin::detail() const alloc_except {
    return fmt::format("{} - {}", signature, category);
}

std::string Builtin::documentation() const alloc_except {
    std::string doc = fmt::format("{}\n\nCategory: {}\n\nExamples:", description, category);
    for(std::string_view example : examples){
        doc += '\n';
        doc += example;
    }

    return doc;
}

const std::vector<Builtin>& builtins() noexcept {
    return builtin_catalog;
}

const Builtin* findBuiltin(std::string_view name) noexcept {
    auto lookup = builtin_lookup.find(name);
    return lookup == builtin_lookup.end() ? nullptr : &builtin_catalog[lookup->second];
}

}

}
