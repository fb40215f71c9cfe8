// CLRP实例管理类
// 负责存储和查询选址-路径问题实例的所有信息
#ifndef _CLRPSA_INSTANCE_HPP_
#define _CLRPSA_INSTANCE_HPP_

#include <algorithm>
#include <cassert>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../base/NonCopyable.hpp"

namespace clrpsa {

    // Routing layer. Primary routes leave a top-tier facility and visit intermediate facilities, secondary routes leave a facility and
    // visit customers. One-echelon instances only have secondary routes.
    // 路径层级：一级路径（设施->中转设施），二级路径（设施->顾客）
    enum class Tier { PRIMARY = 0, SECONDARY = 1 };

    // Distance rounding rule.
    // 距离取整规则
    enum class Rounding { EXACT, CEIL, ROUND };

    std::string to_string(Tier tier);
    std::string to_string(Rounding rounding);
    std::optional<Rounding> rounding_from_string(const std::string& value);

    // Raised when a structural precondition of the instance is violated.
    // 实例结构性前提条件不满足时抛出
    class InstanceInvalid : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // Manages a CLRP instance by providing a set of methods to query its properties.
    //
    // Vertices share a single index space: facilities are in [0, F) and customers in [F, F + C), so that `get_cost(i, j)` works for any
    // pair of locations.
    // 所有顶点共享同一个下标空间：设施在[0, F)，顾客在[F, F + C)
    class Instance : private NonCopyable<Instance> {
    public:
        struct Facility {
            double x = 0.0;
            double y = 0.0;
            double opening_cost = 0.0;
            int capacity = 0;
            Tier tier = Tier::SECONDARY;
        };

        struct Customer {
            double x = 0.0;
            double y = 0.0;
            int demand = 0;
        };

        // Vehicle class used by the routes of one tier.
        // 某一层级路径使用的车辆类型
        struct Vehicle {
            int capacity = 0;
            double fixed_cost = 0.0;  // 每条路径的固定成本
            double unit_cost = 1.0;   // 单位距离成本
        };

        // Fully populated description used to build an instance.
        // 构建实例所需的完整数据
        struct Data {
            std::string name;
            std::vector<Facility> facilities;
            std::vector<Customer> customers;
            Vehicle primary_vehicle;
            Vehicle secondary_vehicle;
            int echelons = 1;
            Rounding rounding = Rounding::EXACT;
        };

        // Returns an optional containing the instance stored in the Prodhon `.dat` file at `filepath`, nullopt if the file cannot be
        // parsed. Throws InstanceInvalid if the parsed data violates a structural precondition.
        // 从.dat文件创建实例，解析失败返回nullopt，数据不合法时抛出InstanceInvalid
        static std::optional<Instance> make(const std::string& filepath, Rounding rounding = Rounding::CEIL);

        // Throws InstanceInvalid if `data` violates a structural precondition.
        explicit Instance(Data data);

        inline const std::string& get_name() const {
            return name;
        }

        // Returns the number of routing layers, 1 or 2.
        // 返回层级数（1或2）
        inline int get_echelons() const {
            return echelons;
        }

        inline bool is_two_echelon() const {
            return echelons == 2;
        }

        inline Rounding get_rounding() const {
            return rounding;
        }

        inline int get_facilities_num() const {
            return static_cast<int>(facilities.size());
        }

        inline int get_customers_num() const {
            return get_vertices_num() - get_facilities_num();
        }

        inline int get_vertices_num() const {
            return static_cast<int>(xcoords.size());
        }

        inline int get_facilities_begin() const {
            return 0;
        }

        inline int get_facilities_end() const {
            return get_facilities_num();
        }

        inline int get_customers_begin() const {
            return get_facilities_num();
        }

        inline int get_customers_end() const {
            return get_vertices_num();
        }

        inline bool is_facility(int vertex) const {
            return vertex >= get_facilities_begin() && vertex < get_facilities_end();
        }

        inline bool is_customer(int vertex) const {
            return vertex >= get_customers_begin() && vertex < get_customers_end();
        }

        inline Tier get_facility_tier(int facility) const {
            assert(is_facility(facility));
            return facilities[facility].tier;
        }

        inline double get_opening_cost(int facility) const {
            assert(is_facility(facility));
            return facilities[facility].opening_cost;
        }

        inline int get_facility_capacity(int facility) const {
            assert(is_facility(facility));
            return facilities[facility].capacity;
        }

        // Returns the facilities whose routes belong to `tier`, sorted by index.
        // 返回指定层级的设施列表（按下标升序）
        inline const std::vector<int>& get_facilities_of_tier(Tier tier) const {
            return tier == Tier::PRIMARY ? primary_facilities : secondary_facilities;
        }

        // Returns the demand of customer `i`.
        inline int get_demand(int i) const {
            assert(is_customer(i));
            return demands[i];
        }

        inline int get_total_demand() const {
            return total_demand;
        }

        // Returns the cost of arc (i, j), the rounded Euclidean distance.
        // 返回弧(i, j)的距离（按取整规则处理后的欧几里得距离）
        inline double get_cost(int i, int j) const {
            assert(i >= 0 && i < get_vertices_num());
            assert(j >= 0 && j < get_vertices_num());
            return distances[static_cast<size_t>(i) * static_cast<size_t>(get_vertices_num()) + static_cast<size_t>(j)];
        }

        inline const Vehicle& get_vehicle(Tier tier) const {
            return tier == Tier::PRIMARY ? primary_vehicle : secondary_vehicle;
        }

        inline int get_vehicle_capacity(Tier tier) const {
            return get_vehicle(tier).capacity;
        }

        inline double get_route_fixed_cost(Tier tier) const {
            return get_vehicle(tier).fixed_cost;
        }

        inline double get_unit_cost(Tier tier) const {
            return get_vehicle(tier).unit_cost;
        }

        // Returns the tier of the routes visiting customers.
        inline Tier get_customer_tier() const {
            return Tier::SECONDARY;
        }

        // Returns the capacity of `facility` that routes can actually use. With two echelons the throughput of an intermediate facility
        // must fit a single primary vehicle, since primary routes do not split deliveries.
        // 返回设施的可用容量。两级实例中，中转设施的吞吐量不能超过一级车辆容量
        inline int get_usable_capacity(int facility) const {
            const auto capacity = get_facility_capacity(facility);
            if (is_two_echelon() && get_facility_tier(facility) == Tier::SECONDARY) {
                return std::min(capacity, primary_vehicle.capacity);
            }
            return capacity;
        }

    private:
        // 检查结构性前提条件
        void validate(const Data& data) const;

        std::string name;
        int echelons = 1;
        Rounding rounding = Rounding::EXACT;

        std::vector<Facility> facilities;
        std::vector<int> primary_facilities;
        std::vector<int> secondary_facilities;

        Vehicle primary_vehicle;
        Vehicle secondary_vehicle;

        // Vertices coordinates.
        // 所有顶点的坐标
        std::vector<double> xcoords;
        std::vector<double> ycoords;

        // Customers demands (zero for facilities).
        // 顾客需求量（设施为0）
        std::vector<int> demands;
        int total_demand = 0;

        // Full distance matrix, row-major.
        // 完整的距离矩阵（行优先）
        std::vector<double> distances;
    };

}  // namespace clrpsa

#endif
