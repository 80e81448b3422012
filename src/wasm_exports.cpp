#include "wasm_exports.h"
#include <set>

namespace cverify {

const std::vector<std::string> RESERVED_EXPORTS = {"_initialize", "alloc"};

namespace {

constexpr uint8_t SECTION_CUSTOM = 0;
constexpr uint8_t SECTION_IMPORT = 2;
constexpr uint8_t SECTION_FUNCTION = 3;
constexpr uint8_t SECTION_EXPORT = 7;
constexpr uint8_t SECTION_CODE = 10;
constexpr uint8_t SECTION_MAX_ID = 13;

// Bounds-checked cursor over a byte range
class Reader {
public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    bool at_end() const { return pos_ >= size_; }
    size_t remaining() const { return size_ - pos_; }

    uint8_t byte() {
        if (pos_ >= size_) {
            throw WasmParseError("unexpected end of data");
        }
        return data_[pos_++];
    }

    uint64_t leb(int max_bits) {
        uint64_t result = 0;
        int shift = 0;
        while (true) {
            uint8_t b = byte();
            if (shift >= max_bits) {
                throw WasmParseError("LEB128 integer too long");
            }
            result |= static_cast<uint64_t>(b & 0x7f) << shift;
            if ((b & 0x80) == 0) {
                break;
            }
            shift += 7;
        }
        if (max_bits < 64 && (result >> max_bits) != 0) {
            throw WasmParseError("LEB128 integer out of range");
        }
        return result;
    }

    uint32_t u32() { return static_cast<uint32_t>(leb(32)); }

    std::string name() {
        uint32_t len = u32();
        if (len > remaining()) {
            throw WasmParseError("name runs past section end");
        }
        std::string s(reinterpret_cast<const char*>(data_ + pos_), len);
        pos_ += len;
        return s;
    }

    Reader sub(size_t n) {
        if (n > remaining()) {
            throw WasmParseError("section runs past end of module");
        }
        Reader r(data_ + pos_, n);
        pos_ += n;
        return r;
    }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
};

void skip_limits(Reader& r) {
    uint8_t flags = r.byte();
    if (flags > 0x07) {
        throw WasmParseError("bad limits flags");
    }
    int bits = (flags & 0x04) ? 64 : 32;
    r.leb(bits);
    if (flags & 0x01) {
        r.leb(bits);
    }
}

// Returns the number of imported functions
uint32_t parse_import_section(Reader r) {
    uint32_t count = r.u32();
    uint32_t functions = 0;
    for (uint32_t i = 0; i < count; ++i) {
        r.name();  // module
        r.name();  // field
        uint8_t kind = r.byte();
        switch (kind) {
            case 0x00:  // function: type index
                r.u32();
                ++functions;
                break;
            case 0x01:  // table: reftype + limits
                r.byte();
                skip_limits(r);
                break;
            case 0x02:  // memory
                skip_limits(r);
                break;
            case 0x03:  // global: valtype + mutability
                r.byte();
                r.byte();
                break;
            case 0x04:  // tag: attribute + type index
                r.byte();
                r.u32();
                break;
            default:
                throw WasmParseError("unknown import kind " + std::to_string(kind));
        }
    }
    if (!r.at_end()) {
        throw WasmParseError("trailing bytes in import section");
    }
    return functions;
}

std::vector<WasmExport> parse_export_section(Reader r) {
    std::vector<WasmExport> exports;
    std::set<std::string> seen;
    uint32_t count = r.u32();
    for (uint32_t i = 0; i < count; ++i) {
        WasmExport e;
        e.name = r.name();
        uint8_t kind = r.byte();
        if (kind > static_cast<uint8_t>(ExportKind::TAG)) {
            throw WasmParseError("unknown export kind " + std::to_string(kind));
        }
        e.kind = static_cast<ExportKind>(kind);
        e.index = r.u32();
        if (!seen.insert(e.name).second) {
            throw WasmParseError("duplicate export name '" + e.name + "'");
        }
        exports.push_back(std::move(e));
    }
    if (!r.at_end()) {
        throw WasmParseError("trailing bytes in export section");
    }
    return exports;
}

} // namespace

std::vector<WasmExport> parse_exports(const std::vector<uint8_t>& module) {
    Reader r(module.data(), module.size());

    static const uint8_t MAGIC[4] = {0x00, 0x61, 0x73, 0x6d};
    static const uint8_t VERSION[4] = {0x01, 0x00, 0x00, 0x00};
    if (module.size() < 8) {
        throw WasmParseError("too short for a module header");
    }
    for (int i = 0; i < 4; ++i) {
        if (r.byte() != MAGIC[i]) {
            throw WasmParseError("bad magic number");
        }
    }
    for (int i = 0; i < 4; ++i) {
        if (r.byte() != VERSION[i]) {
            throw WasmParseError("unsupported binary version");
        }
    }

    std::set<uint8_t> seen_sections;
    std::vector<WasmExport> exports;
    uint32_t imported_functions = 0;
    uint32_t declared_functions = 0;
    uint32_t code_bodies = 0;

    while (!r.at_end()) {
        uint8_t id = r.byte();
        uint32_t size = r.u32();
        Reader section = r.sub(size);

        if (id > SECTION_MAX_ID) {
            throw WasmParseError("unknown section id " + std::to_string(id));
        }
        if (id != SECTION_CUSTOM && !seen_sections.insert(id).second) {
            throw WasmParseError("duplicate section id " + std::to_string(id));
        }

        switch (id) {
            case SECTION_CUSTOM:
                section.name();
                break;
            case SECTION_IMPORT:
                imported_functions = parse_import_section(section);
                break;
            case SECTION_FUNCTION:
                declared_functions = section.u32();
                break;
            case SECTION_EXPORT:
                exports = parse_export_section(section);
                break;
            case SECTION_CODE:
                code_bodies = section.u32();
                break;
            default:
                break;
        }
    }

    if (declared_functions != code_bodies) {
        throw WasmParseError("function and code section counts differ");
    }

    uint64_t total_functions = static_cast<uint64_t>(imported_functions) + declared_functions;
    for (const auto& e : exports) {
        if (e.kind == ExportKind::FUNCTION && e.index >= total_functions) {
            throw WasmParseError("export '" + e.name + "' refers to unknown function " +
                                 std::to_string(e.index));
        }
    }

    return exports;
}

std::vector<std::string> list_exports(const std::vector<uint8_t>& module) {
    std::vector<std::string> names;
    for (const auto& e : parse_exports(module)) {
        if (e.kind != ExportKind::FUNCTION) {
            continue;
        }
        bool reserved = false;
        for (const auto& r : RESERVED_EXPORTS) {
            if (e.name == r) {
                reserved = true;
                break;
            }
        }
        if (!reserved) {
            names.push_back(e.name);
        }
    }
    return names;
}

} // namespace cverify
