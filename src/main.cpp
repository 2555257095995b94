// Copyright 2022 Eric Fichter
#include "headers.h"
#include "Project.h"

//!\mainpage Archetype-based building envelope generation for building performance simulation
//! Building performance simulation needs a parameterized description of the building envelope, even if only
//! a few characteristics of a building are known, e.g. for district level studies. ARCH2ENV generates such
//! descriptions for residential archetype buildings. Net leased area, number and height of floors and a few
//! categorical values (floor layout, neighbour buildings, attic, cellar, dormer) are used to estimate the areas
//! of outer walls, windows, roofs and ground floors per orientation according to the IWU short method.
//! The constructions of all elements are taken from a normative type element database by year of construction
//! and construction standard.

namespace po = boost::program_options;

void print_usage(bool suggest_help = true) {
    std::cout << "\nUsage: ARCH2ENV [options] --year <year> [<year> ...] --floors <n> --height <m> --area <m2>\n"
              << "\n"
              << "Generation of residential archetype buildings with estimated envelope areas and typical constructions.\n"
              << "One building is generated for each given year of construction.\n";
    if (suggest_help) std::cout << "\nRun 'ARCH2ENV --help' for more information.";
    std::cout << std::endl;
}

void print_options(const po::options_description &options) {
    std::cout << "\n" << options;
    std::cout << std::endl;
}

void print_version() {
    std::cout << ARCH2ENV_NAME << " " << ARCH2ENV_VERSION << " (uses Boost " << BOOST_LIB_VERSION << " and oneTBB " << TBB_VERSION_MAJOR << "." << TBB_VERSION_MINOR << ")\n";
}

bool file_exists(const std::string &filename) {
    boost::system::error_code ec;
    return boost::filesystem::is_regular_file(filename, ec);
}

std::string data_file(const std::string &data_dir, const std::string &file) {
    return (boost::filesystem::path(data_dir) / file).string();
}

int main(int argc, char **argv) {

    typedef po::command_line_parser command_line_parser;

    unsigned int num_threads;
    std::string config_file;
    std::string data_dir, type_elements_file, materials_file, use_conditions_file;
    std::string name, construction, approach;
    std::vector<int> years;
    int number_of_floors, residential_layout, neighbour_buildings, attic, cellar, dormer;
    double height_of_floors, net_leased_area;

    // Generic options
    po::options_description generic_options("Command line options");
    generic_options.add_options()
            ("help,h", "display usage information")
            ("version,v", "display version information")
            ("config,c", po::value<std::string>(&config_file), "read further options from an ini style configuration file, command line options take precedence")
            ("threads,j", po::value<unsigned int>(&num_threads)->default_value(1), "Number of parallel processing threads for archetype generation");

    // Data options
    po::options_description data_options("Data options");
    data_options.add_options()
            ("data-dir", po::value<std::string>(&data_dir)->default_value(ARCH2ENV_DATA_DIR), "directory of the json data files")
            ("type-elements", po::value<std::string>(&type_elements_file), "type element database (default <data-dir>/TypeElements.json)")
            ("materials", po::value<std::string>(&materials_file), "material templates (default <data-dir>/MaterialTemplates.json)")
            ("use-conditions", po::value<std::string>(&use_conditions_file), "use conditions (default <data-dir>/UseConditions.json)");

    // Building options
    po::options_description building_options("Building options");
    building_options.add_options()
            ("name", po::value<std::string>(&name)->default_value("SingleFamilyDwelling"), "name of the building, the year is appended")
            ("year", po::value<std::vector<int>>(&years)->multitoken(), "year(s) of construction")
            ("construction", po::value<std::string>(&construction)->default_value("iwu_heavy"), "construction data: iwu_heavy, iwu_light, kfw_40, kfw_55, kfw_70, kfw_85, kfw_100")
            ("floors", po::value<int>(&number_of_floors), "number of floors above ground")
            ("height", po::value<double>(&height_of_floors), "average height of floors in m")
            ("area", po::value<double>(&net_leased_area), "net leased area in m2 (not the footprint)")
            ("layout", po::value<int>(&residential_layout)->default_value(0), "floor layout: 0 compact, 1 elongated/complex")
            ("neighbours", po::value<int>(&neighbour_buildings)->default_value(0), "number of neighbour buildings: 0, 1, 2")
            ("attic", po::value<int>(&attic)->default_value(0), "attic: 0 flat roof, 1 non heated, 2 partly heated, 3 heated")
            ("cellar", po::value<int>(&cellar)->default_value(0), "cellar: 0 no cellar, 1 non heated, 2 partly heated, 3 heated")
            ("dormer", po::value<int>(&dormer)->default_value(0), "dormer: 0 no dormer, 1 dormer")
            ("inner-wall-approach", po::value<std::string>(&approach)->default_value("teaser_default"), "inner wall approximation: teaser_default, typical_minus_outer")
            ("lenient", "continue with a warning if no unique type element is found for an element");

    // Command line options
    po::options_description cmdline_options;
    cmdline_options.add(generic_options).add(data_options).add(building_options);

    // Configuration file options
    po::options_description config_file_options;
    config_file_options.add(data_options).add(building_options);

    po::variables_map vmap;
    try {
        po::store(command_line_parser(argc, argv).options(cmdline_options).run(), vmap);
        if (vmap.count("config")) {
            const std::string cfg = vmap["config"].as<std::string>();
            std::ifstream ifs(cfg);
            if (!ifs.good()) {
                std::cerr << "[Error] Configuration file '" << cfg << "' could not be opened!" << std::endl;
                return EXIT_FAILURE;
            }
            po::store(po::parse_config_file(ifs, config_file_options), vmap);
        }
    } catch (const po::unknown_option &e) {
        std::cerr << "[Error] Unknown option '" << e.get_option_name().c_str() << "'\n\n";
        print_usage();
        return EXIT_FAILURE;
    } catch (const po::error_with_option_name &e) {
        std::cerr << "[Error] Invalid usage of '" << e.get_option_name().c_str() << "': " << e.what() << "\n\n";
        return EXIT_FAILURE;
    } catch (const std::exception &e) {
        std::cerr << "[Error] " << e.what() << "\n\n";
        print_usage();
        return EXIT_FAILURE;
    }

    po::notify(vmap);

    if (vmap.count("version")) {
        print_version();
        return EXIT_SUCCESS;
    } else if (vmap.count("help")) {
        print_usage(false);
        print_options(generic_options.add(data_options).add(building_options));
        return EXIT_SUCCESS;
    } else if (years.empty()) {
        std::cerr << "[Error] Year of construction not specified!" << std::endl;
        print_usage();
        return EXIT_FAILURE;
    } else if (!vmap.count("floors") || !vmap.count("height") || !vmap.count("area")) {
        std::cerr << "[Error] Number of floors, height of floors and net leased area are mandatory!" << std::endl;
        print_usage();
        return EXIT_FAILURE;
    }

    if (number_of_floors < 1) {
        std::cerr << "[Error] At least one floor is needed!" << std::endl;
        return EXIT_FAILURE;
    }

    if (height_of_floors <= 0 || net_leased_area <= 0) {
        std::cerr << "[Error] Height of floors and net leased area must be positive!" << std::endl;
        return EXIT_FAILURE;
    }

    ConstructionData construction_data;
    try { construction_data = ConstructionData::FromString(construction); }
    catch (const configuration_error &e) {
        std::cerr << "[Error] " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    inner_wall_approach inner_walls_approach;
    if (approach == "teaser_default")
        inner_walls_approach = TEASER_DEFAULT;
    else if (approach == "typical_minus_outer")
        inner_walls_approach = TYPICAL_MINUS_OUTER;
    else {
        std::cerr << "[Error] Unknown inner wall approach '" << approach << "'!" << std::endl;
        return EXIT_FAILURE;
    }

    const bool strict = vmap.count("lenient") == 0;

    // data files
    if (type_elements_file.empty()) type_elements_file = data_file(data_dir, "TypeElements.json");
    if (materials_file.empty()) materials_file = data_file(data_dir, "MaterialTemplates.json");
    if (use_conditions_file.empty()) use_conditions_file = data_file(data_dir, "UseConditions.json");

    for (const auto &f: {type_elements_file, materials_file, use_conditions_file})
        if (!file_exists(f)) {
            std::cerr << "[Error] Data file '" << f << "' does not exist!" << std::endl;
            return EXIT_FAILURE;
        }

    // number of threads
    if (num_threads <= 0 || num_threads > std::thread::hardware_concurrency())
        num_threads = std::thread::hardware_concurrency();

    // user info
    std::cout << "\n";
    std::cout << "\033[1m\033[37m";
    std::cout << "-------------------------------------------------\n";
    std::cout << "### " << ARCH2ENV_FULLNAME << " " << ARCH2ENV_NAME << " ###\n";
    std::cout << "Generation of residential archetype building envelopes.\n";
    std::cout << "\n";
    std::cout << "Version:     " << ARCH2ENV_VERSION << " (2022)" << "\n";
    std::cout << "Developer:   " << ARCH2ENV_AUTHOR << "\n";
    std::cout << "Institute:   E3D - Institute of Energy Efficiency and Sustainable Building,\n";
    std::cout << "             RWTH Aachen University \n";
    std::cout << "-------------------------------------------------\n";
    std::cout << "\033[0m";
    std::cout << "\n";
    std::cout << "-------------------------------------------------\n";
    std::cout << "# Arguments\n";
    std::cout << "Type elements:       " << type_elements_file << "\n";
    std::cout << "Materials:           " << materials_file << "\n";
    std::cout << "Use conditions:      " << use_conditions_file << "\n";
    std::cout << "Threads:             " << std::to_string(num_threads) << "\n";
    std::cout << "Years:               ";
    for (auto y: years) std::cout << y << " ";
    std::cout << "\n";
    std::cout << "Construction:        " << construction_data.ToString() << "\n";
    std::cout << "Floors:              " << number_of_floors << "\n";
    std::cout << "Height of floors:    " << height_of_floors << "\n";
    std::cout << "Net leased area:     " << net_leased_area << "\n";
    std::cout << "Layout:              " << residential_layout << "\n";
    std::cout << "Neighbours:          " << neighbour_buildings << "\n";
    std::cout << "Attic:               " << attic << "\n";
    std::cout << "Cellar:              " << cellar << "\n";
    std::cout << "Dormer:              " << dormer << "\n";
    std::cout << "Inner walls:         " << approach << "\n";
    std::cout << "Strict:              " << std::boolalpha << strict << "\n";
    std::cout << "-------------------------------------------------\n";

    std::cout << "\n-------------------------------------------------" << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    Project P(name);
    bool status = P.LoadData(type_elements_file, materials_file, use_conditions_file);

    if (status) {

        for (auto year: years) {
            SingleFamilyDwelling &building = P.AddResidential(name + "_" + std::to_string(year),
                                                              year,
                                                              number_of_floors,
                                                              height_of_floors,
                                                              net_leased_area,
                                                              construction_data,
                                                              residential_layout,
                                                              neighbour_buildings,
                                                              attic,
                                                              cellar,
                                                              dormer);
            building.strict = strict;
            building.inner_walls_approach = inner_walls_approach;
        }

        status = P.GenerateAll(num_threads);
        P.Log();
    }

    if (status) std::cout << "Program finished successfully!" << std::endl;
    else std::cout << "Program interrupted by error!" << std::endl;

    auto finish = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = finish - start;
    std::cout << "Total Elapsed time: " << elapsed.count() << " s\n";
    std::cout << "-------------------------------------------------\n";

    return status ? EXIT_SUCCESS : EXIT_FAILURE;
}
