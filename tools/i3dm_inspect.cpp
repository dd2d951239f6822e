/**
 * i3dm_inspect - Decode an Instanced 3D Model tile and print it as JSON.
 *
 * Instances are listed with their model matrix, the WGS84 longitude,
 * latitude and height of their position and whether the matrix is usable
 * (finite and not collapsed by a zero scale).
 *
 * Usage: i3dm_inspect <tile.i3dm> [--strict] [--verbose] [--limit N]
 *
 *   --strict   require the header byteLength to fit the file
 *   --verbose  debug logging
 *   --limit N  print at most N instances (default 16, 0 = all)
 */

#include "core/format/errors.h"
#include "core/format/i3dm_reader.h"
#include "core/instancing/instance_builder.h"
#include "core/coordinate/coordinate_converter.h"
#include "core/coordinate/transform_builder.h"
#include "log.h"
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using namespace I3dm::Core;

namespace {

std::vector<uint8_t> readFileBytes(const std::string& path) {
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f) return {};
    auto size = f.tellg();
    if (size <= 0) return {};
    f.seekg(0);
    std::vector<uint8_t> buf(static_cast<size_t>(size));
    f.read(reinterpret_cast<char*>(buf.data()), size);
    return buf;
}

void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <tile.i3dm> [--strict] [--verbose] [--limit N]\n";
}

}

int main(int argc, char** argv) {
    std::string inputPath;
    Format::ReaderOptions options;
    size_t limit = 16;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--strict") {
            options.strictByteLength = true;
        } else if (arg == "--verbose") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = static_cast<size_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (!arg.empty() && arg[0] == '-') {
            printUsage(argv[0]);
            return 1;
        } else {
            inputPath = arg;
        }
    }
    if (inputPath.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    std::vector<uint8_t> bytes = readFileBytes(inputPath);
    if (bytes.empty()) {
        LOG_E("open file [%s] fail!", inputPath.c_str());
        return 1;
    }

    try {
        Format::I3dmTile tile = Format::readI3dmTile(bytes, 0, options);
        std::vector<Instancing::Instance> instances = Instancing::InstanceBuilder::build(*tile.featureTable);

        nlohmann::json out;
        const Format::I3dmHeader& h = tile.header;
        out["header"] = {
            {"version", h.version},
            {"byteLength", h.byteLength},
            {"featureTableJSONByteLength", h.featureTableJsonByteLength},
            {"featureTableBinaryByteLength", h.featureTableBinaryByteLength},
            {"batchTableJSONByteLength", h.batchTableJsonByteLength},
            {"batchTableBinaryByteLength", h.batchTableBinaryByteLength},
            {"gltfByteLength", h.gltfByteLength},
            {"gltfFormat", static_cast<uint32_t>(h.gltfFormat)}
        };
        if (tile.hasEmbeddedGltf()) {
            out["gltf"] = {{"embedded", true}, {"byteLength", tile.gltf.size()}};
        } else {
            out["gltf"] = {{"embedded", false}, {"uri", tile.gltfUri}};
        }
        out["featureTable"] = tile.featureTable->json();
        if (!tile.batchTableJson.is_null()) {
            out["batchTable"] = tile.batchTableJson;
        }
        out["instancesLength"] = instances.size();

        size_t degenerate = 0;
        nlohmann::json list = nlohmann::json::array();
        for (size_t i = 0; i < instances.size(); ++i) {
            bool valid = Geo::TransformBuilder::validateTransform(instances[i].modelMatrix);
            if (!valid) {
                ++degenerate;
            }
            if (limit != 0 && i >= limit) continue;
            glm::dvec3 position(instances[i].modelMatrix[3]);
            double lon, lat, height;
            Geo::CoordinateConverter::ecefToGeographic(position, lon, lat, height);
            list.push_back({
                {"batchId", instances[i].batchId},
                {"modelMatrix", Geo::TransformBuilder::serializeMatrix(instances[i].modelMatrix)},
                {"cartographic", {lon, lat, height}},
                {"validTransform", valid}
            });
        }
        out["instances"] = list;
        out["degenerateInstances"] = degenerate;
        if (degenerate > 0) {
            LOG_W("%zu instances have a non-finite or singular model matrix", degenerate);
        }

        // The glTF uri and table strings come from the file and may not be UTF-8
        std::cout << out.dump(4, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    } catch (const Format::I3dmError& e) {
        LOG_E("decode [%s] fail: %s", inputPath.c_str(), e.what());
        return 2;
    } catch (const std::exception& e) {
        LOG_E("inspect [%s] fail: %s", inputPath.c_str(), e.what());
        return 2;
    }
    return 0;
}
