#ifndef AETHER_COMMON_H
#define AETHER_COMMON_H

#include <cstddef>
#include <limits>
#include <parallel_hashmap/phmap.h>

#define AETHER_UNORDERED_MAP phmap::flat_hash_map
#define AETHER_STATIC_MAP const phmap::flat_hash_map
#define AETHER_UNORDERED_SET phmap::flat_hash_set

//Marks functions which only throw on allocation failure
#define alloc_except

namespace Aether {

typedef size_t ParseNode;
extern inline constexpr size_t NONE = std::numeric_limits<size_t>::max();

namespace Code {
struct Error;
class ErrorStream;
class ParseTree;
class Scanner;
class Settings;
class SymbolTable;
}

class ParsedDocument;

}

#endif // AETHER_COMMON_H
