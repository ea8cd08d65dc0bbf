// h5cx_blocks.cpp
#include "h5cx/core/blocks/BlockIterator.hpp"
#include "h5cx/core/blocks/BlockPlanner.hpp"
#include "h5cx/core/h5/H5File.hpp"
#include "h5cx/core/util/Config.hpp"
#include "h5cx/core/util/Errors.hpp"

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>

namespace fs = std::filesystem;
namespace po = boost::program_options;
using json = nlohmann::json;

static json extentToJson(const h5cx::DatasetExtent& extent)
{
    json j;
    j["dimensions"] = extent.dimensions;
    if (extent.chunkShape) {
        j["chunk_shape"] = *extent.chunkShape;
    } else {
        j["chunk_shape"] = nullptr;
    }
    if (extent.maxDimensions) {
        json maxDims = json::array();
        for (auto m : *extent.maxDimensions) {
            if (m == h5cx::kUnlimited) {
                maxDims.push_back("unlimited");
            } else {
                maxDims.push_back(m);
            }
        }
        j["max_dimensions"] = maxDims;
    } else {
        j["max_dimensions"] = extent.dimensions;
    }
    return j;
}

int main(int argc, char* argv[])
{
    po::options_description opts("h5cx_blocks options");
    opts.add_options()
        ("help,h", "Show help")
        ("input,i", po::value<std::string>()->required(), "Input HDF5 file")
        ("dataset,d", po::value<std::string>()->required(), "Dataset path inside the file")
        ("limit,n", po::value<std::uint64_t>(), "Print at most this many blocks")
        ("config,c", po::value<std::string>(), "Container configuration (JSON)");

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(opts).run(), vm);
        if (vm.count("help")) {
            std::cout << opts << "\n";
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\nUse --help for usage\n";
        return 1;
    }

    fs::path input = vm["input"].as<std::string>();
    std::string datasetPath = vm["dataset"].as<std::string>();
    std::uint64_t limit = std::numeric_limits<std::uint64_t>::max();
    if (vm.count("limit")) {
        limit = vm["limit"].as<std::uint64_t>();
    }

    try {
        h5cx::ContainerConfig config;
        if (vm.count("config")) {
            config = h5cx::ContainerConfig::load(vm["config"].as<std::string>());
        }
        config.applyLogging();

        auto file = h5cx::H5File::openReadOnly(input, config);
        auto dataset = file->openDataset(datasetPath);
        auto extent = dataset.extent();
        auto blockShape = h5cx::naturalBlockShape(extent);

        json out;
        out["file"] = input.string();
        out["dataset"] = datasetPath;
        out["extent"] = extentToJson(extent);
        out["block_shape"] = blockShape;
        out["block_count"] = h5cx::totalBlockCount(extent, blockShape);

        // descriptors only; no block data is read
        json blocks = json::array();
        h5cx::BlockCursor cursor(h5cx::blockCounts(extent, blockShape));
        for (std::uint64_t n = 0; cursor.ready() && n < limit; ++n, cursor.advance()) {
            auto block = h5cx::planBlock(extent, blockShape, h5cx::BlockNumber{cursor.index()});
            blocks.push_back({
                {"index", block.index},
                {"offset", block.offset},
                {"shape", block.shape},
            });
        }
        out["blocks"] = blocks;
        out["truncated"] = cursor.ready();

        std::cout << out.dump(2) << std::endl;
    } catch (const h5cx::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
