// CLRP实例文件解析器
// 读取Prodhon/Tuzun格式的.dat文件
#ifndef _CLRPSA_PARSER_HPP_
#define _CLRPSA_PARSER_HPP_

#include <optional>
#include <string>
#include <vector>

namespace clrpsa {

    // Reader of the Prodhon/Tuzun `.dat` CLRP layout. Blank lines are ignored, every value is on its own line (coordinates are `x y`
    // pairs):
    //
    //   n_customers
    //   n_depots
    //   depot coordinates        (n_depots lines)
    //   customer coordinates     (n_customers lines)
    //   vehicle capacity
    //   depot capacities         (n_depots lines)
    //   customer demands         (n_customers lines)
    //   depot opening costs      (n_depots lines)
    //   route setup cost
    //   cost type                (optional, ignored)
    class Parser {
    public:
        // Raw content of the file, no validation beyond syntax.
        // 解析得到的原始数据（只做语法检查）
        struct Data {
            std::vector<double> depot_xcoords;
            std::vector<double> depot_ycoords;
            std::vector<double> depot_capacities;
            std::vector<double> depot_opening_costs;
            std::vector<double> customer_xcoords;
            std::vector<double> customer_ycoords;
            std::vector<double> customer_demands;
            double vehicle_capacity = 0.0;
            double route_setup_cost = 0.0;
        };

        explicit Parser(std::string filepath);

        // Returns the parsed data, or nullopt if the file cannot be opened or does not follow the layout.
        // 读取失败或格式错误时返回nullopt
        std::optional<Data> parse() const;

    private:
        std::string filepath;
    };

}  // namespace clrpsa

#endif
