#include "mincbor/cbor_easy.hpp"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>


static void print_hex(const std::string& label, const std::vector<std::uint8_t>& b) {
    std::cout << label << " (" << b.size() << " bytes):";
    for (auto x : b) std::cout << ' ' << std::hex << std::setw(2) << std::setfill('0') << static_cast<unsigned>(x);
    std::cout << std::dec << "\n";
}

int main() {
    try {
        using namespace mincbor;

        // A sensor reading, described as a record with field directives
        std::map<std::string, double> calib{{"gain", 1.5}, {"offset", -0.25}};
        std::vector<std::uint8_t> raw = {0xde, 0xad, 0xbe, 0xef};

        Value reading = easy::RecordBuilder("Reading")
            .field("Id", 42u, "id")
            .field("Name", std::string("probe-7"), "name")
            .field("Samples", std::vector<int>{-1, 0, 1, 1000}, "samples")
            .field("Raw", raw, "raw")
            .field("Calibration", calib, "cal")
            .field("Temperature", 21.5, "temp")
            .field("Note", std::string(), "note,omitempty")
            .field("Parent", std::shared_ptr<int>(), "parent")
            .field("Cache", std::vector<int>{9, 9, 9}, "-")
            .build();

        print_hex("reading", encode(reading));
        std::cout << "encoded_size=" << encoded_size(reading) << "\n";

        // Same data from a native value, keys in canonical order
        EncodeOptions sorted;
        sorted.sort_map_keys = true;
        std::map<int, std::optional<std::string>> sparse{{100, std::string("x")}, {1, std::nullopt}};
        print_hex("sparse", easy::encode(sparse, sorted));

        // Write
        WriteOptions wo;
        wo.compression = CompressionMode::Gzip;
        wo.zlib_level = 6;

        std::string file = "demo_out.cbor.gz";
        write_file(file, reading, wo);
        std::cout << "Wrote: " << file << "\n";

        std::cout << "OK\n";
        return 0;

    } catch (const mincbor::CborError& e) {
        std::cerr << "CBOR error (" << mincbor::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
