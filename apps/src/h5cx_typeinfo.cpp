// h5cx_typeinfo.cpp
#include "h5cx/core/compound/TypeRegistry.hpp"
#include "h5cx/core/h5/H5File.hpp"
#include "h5cx/core/types/TypeVariant.hpp"
#include "h5cx/core/util/Config.hpp"
#include "h5cx/core/util/Errors.hpp"

#include <boost/program_options.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;
namespace po = boost::program_options;
using json = nlohmann::json;

int main(int argc, char* argv[])
{
    po::options_description opts("h5cx_typeinfo options");
    opts.add_options()
        ("help,h", "Show help")
        ("input,i", po::value<std::string>()->required(), "Input HDF5 file")
        ("type,t", po::value<std::string>()->required(), "Name of the committed compound type")
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
    std::string typeName = vm["type"].as<std::string>();

    try {
        h5cx::ContainerConfig config;
        if (vm.count("config")) {
            config = h5cx::ContainerConfig::load(vm["config"].as<std::string>());
        }
        config.applyLogging();

        auto file = h5cx::H5File::openReadOnly(input, config);
        auto members = file->describeType(typeName);

        json out;
        out["file"] = input.string();
        out["type"] = typeName;
        out["path"] = h5cx::TypeRegistry::committedPath(typeName);

        std::size_t size = 0;
        json list = json::array();
        for (const auto& m : members) {
            json jm;
            jm["name"] = m.name;
            jm["offset"] = m.offset;
            jm["size"] = m.size;
            jm["class"] = m.typeClass;
            if (!m.dimensions.empty()) {
                jm["dimensions"] = m.dimensions;
                jm["element_class"] = m.elementClass;
            }
            jm["variant"] = h5cx::toString(m.variant);
            list.push_back(jm);
            size = std::max(size, m.offset + m.size);
        }
        out["record_size"] = size;
        out["members"] = list;

        std::cout << out.dump(2) << std::endl;
    } catch (const h5cx::Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
