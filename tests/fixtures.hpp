// 测试用实例构造函数
#ifndef _CLRPSA_TESTS_FIXTURES_HPP_
#define _CLRPSA_TESTS_FIXTURES_HPP_

#include <random>
#include <utility>
#include <vector>

#include "instance/Instance.hpp"

namespace clrpsa::testing {

    inline Instance::Facility facility(double x, double y, double opening_cost, int capacity, Tier tier = Tier::SECONDARY) {
        Instance::Facility f;
        f.x = x;
        f.y = y;
        f.opening_cost = opening_cost;
        f.capacity = capacity;
        f.tier = tier;
        return f;
    }

    inline Instance::Customer customer(double x, double y, int demand) {
        Instance::Customer c;
        c.x = x;
        c.y = y;
        c.demand = demand;
        return c;
    }

    inline Instance::Data one_echelon_data(std::vector<Instance::Facility> facilities, std::vector<Instance::Customer> customers,
                                           int vehicle_capacity, double fixed_cost) {
        Instance::Data data;
        data.name = "test";
        data.facilities = std::move(facilities);
        data.customers = std::move(customers);
        data.secondary_vehicle.capacity = vehicle_capacity;
        data.secondary_vehicle.fixed_cost = fixed_cost;
        data.echelons = 1;
        data.rounding = Rounding::EXACT;
        return data;
    }

    // Two facilities (capacities 10 and 15, opening costs 100 and 80) and four customers (demands 4, 3, 6, 5). Vehicle capacity 10,
    // route fixed cost 10.
    // 两个设施、四个顾客的示例实例
    inline Instance::Data example_data() {
        return one_echelon_data({facility(0.0, 0.0, 100.0, 10), facility(10.0, 0.0, 80.0, 15)},
                                {customer(1.0, 1.0, 4), customer(2.0, -1.0, 3), customer(9.0, 1.0, 6), customer(11.0, -1.0, 5)}, 10, 10.0);
    }

    // One facility and one customer.
    inline Instance::Data degenerate_data() {
        return one_echelon_data({facility(0.0, 0.0, 5.0, 10)}, {customer(3.0, 4.0, 2)}, 10, 1.0);
    }

    // Random one-echelon instance whose facilities can serve the demand with some slack.
    // 随机单级实例
    inline Instance::Data random_one_echelon_data(unsigned int seed, int facilities_num, int customers_num) {
        auto rand_engine = std::mt19937(seed);
        auto coordinate = std::uniform_real_distribution<double>(0.0, 100.0);
        auto demand = std::uniform_int_distribution<int>(1, 10);
        auto opening = std::uniform_real_distribution<double>(50.0, 150.0);

        auto customers = std::vector<Instance::Customer>();
        auto total_demand = 0;
        for (auto n = 0; n < customers_num; n++) {
            customers.push_back(customer(coordinate(rand_engine), coordinate(rand_engine), demand(rand_engine)));
            total_demand += customers.back().demand;
        }

        const auto capacity = 2 * total_demand / facilities_num + 10;
        auto facilities = std::vector<Instance::Facility>();
        for (auto n = 0; n < facilities_num; n++) {
            facilities.push_back(facility(coordinate(rand_engine), coordinate(rand_engine), opening(rand_engine), capacity));
        }

        auto data = one_echelon_data(std::move(facilities), std::move(customers), 25, 20.0);
        data.name = "random-" + std::to_string(seed);
        return data;
    }

    // Random two-echelon instance: `primary_num` primary facilities, `secondary_num` intermediate facilities.
    // 随机两级实例
    inline Instance::Data random_two_echelon_data(unsigned int seed, int primary_num, int secondary_num, int customers_num) {
        auto data = random_one_echelon_data(seed, secondary_num, customers_num);
        data.name = "random-2e-" + std::to_string(seed);
        data.echelons = 2;

        auto rand_engine = std::mt19937(seed + 1000);
        auto coordinate = std::uniform_real_distribution<double>(0.0, 100.0);

        const auto intermediate_capacity = data.facilities.front().capacity;
        for (auto n = 0; n < primary_num; n++) {
            data.facilities.push_back(
                facility(coordinate(rand_engine), coordinate(rand_engine), 200.0, 2 * secondary_num * intermediate_capacity / primary_num,
                         Tier::PRIMARY));
        }

        data.primary_vehicle.capacity = 2 * intermediate_capacity;
        data.primary_vehicle.fixed_cost = 40.0;
        data.primary_vehicle.unit_cost = 2.0;
        return data;
    }

}  // namespace clrpsa::testing

#endif
