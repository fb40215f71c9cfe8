#include "Parser.hpp"

#include <fstream>
#include <sstream>

namespace clrpsa {

    namespace {

        // Returns the next non blank line of `stream`.
        // 跳过空行，读取下一行
        bool next_line(std::istream& stream, std::string& line) {
            while (std::getline(stream, line)) {
                if (line.find_first_not_of(" \t\r") != std::string::npos) {
                    return true;
                }
            }
            return false;
        }

        bool read_values(std::istream& stream, int count, std::vector<double>& values) {
            std::string line;
            values.resize(count);
            for (int n = 0; n < count; n++) {
                if (!next_line(stream, line)) return false;
                std::istringstream fields(line);
                if (!(fields >> values[n])) return false;
            }
            return true;
        }

        bool read_coordinates(std::istream& stream, int count, std::vector<double>& xcoords, std::vector<double>& ycoords) {
            std::string line;
            xcoords.resize(count);
            ycoords.resize(count);
            for (int n = 0; n < count; n++) {
                if (!next_line(stream, line)) return false;
                std::istringstream fields(line);
                if (!(fields >> xcoords[n] >> ycoords[n])) return false;
            }
            return true;
        }

        bool read_value(std::istream& stream, double& value) {
            std::string line;
            if (!next_line(stream, line)) return false;
            std::istringstream fields(line);
            return static_cast<bool>(fields >> value);
        }

    }  // namespace

    Parser::Parser(std::string filepath_) : filepath(std::move(filepath_)) { }

    std::optional<Parser::Data> Parser::parse() const {

        std::ifstream file(filepath);
        if (!file) {
            return std::nullopt;
        }

        Data data;

        double customers_num = 0.0;
        double depots_num = 0.0;
        if (!read_value(file, customers_num)) return std::nullopt;
        if (!read_value(file, depots_num)) return std::nullopt;
        if (customers_num < 0.0 || depots_num < 0.0) return std::nullopt;

        const auto n = static_cast<int>(customers_num);
        const auto m = static_cast<int>(depots_num);

        if (!read_coordinates(file, m, data.depot_xcoords, data.depot_ycoords)) return std::nullopt;
        if (!read_coordinates(file, n, data.customer_xcoords, data.customer_ycoords)) return std::nullopt;
        if (!read_value(file, data.vehicle_capacity)) return std::nullopt;
        if (!read_values(file, m, data.depot_capacities)) return std::nullopt;
        if (!read_values(file, n, data.customer_demands)) return std::nullopt;
        if (!read_values(file, m, data.depot_opening_costs)) return std::nullopt;
        if (!read_value(file, data.route_setup_cost)) return std::nullopt;

        // 可选的成本类型标记不影响距离，忽略
        return data;
    }

}  // namespace clrpsa
