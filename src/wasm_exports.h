#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

namespace cverify {

class WasmParseError : public std::runtime_error {
public:
    explicit WasmParseError(const std::string& message)
        : std::runtime_error("Invalid wasm module: " + message) {}
};

enum class ExportKind : uint8_t {
    FUNCTION = 0x00,
    TABLE = 0x01,
    MEMORY = 0x02,
    GLOBAL = 0x03,
    TAG = 0x04
};

struct WasmExport {
    std::string name;
    ExportKind kind;
    uint32_t index;
};

// Runtime hooks that every contract exports and that are not part of its API
extern const std::vector<std::string> RESERVED_EXPORTS;

// All entries of the export section, in declaration order
std::vector<WasmExport> parse_exports(const std::vector<uint8_t>& module);

// Function exports minus RESERVED_EXPORTS; throws WasmParseError
std::vector<std::string> list_exports(const std::vector<uint8_t>& module);

} // namespace cverify
