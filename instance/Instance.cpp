#include "Instance.hpp"

#include "Parser.hpp"

#ifdef VERBOSE
    #include <iostream>
#endif

namespace clrpsa {

    std::string to_string(Tier tier) {
        return tier == Tier::PRIMARY ? "primary" : "secondary";
    }

    std::string to_string(Rounding rounding) {
        switch (rounding) {
        case Rounding::EXACT:
            return "exact";
        case Rounding::CEIL:
            return "ceil";
        case Rounding::ROUND:
            return "round";
        }
        return "exact";
    }

    std::optional<Rounding> rounding_from_string(const std::string& value) {
        if (value == "exact") return Rounding::EXACT;
        if (value == "ceil") return Rounding::CEIL;
        if (value == "round") return Rounding::ROUND;
        return std::nullopt;
    }

    namespace {

        // 校验数值是否为整数（.dat文件中的容量和需求以实数形式读入）
        int to_integral(double value, const std::string& what) {
            if (!std::isfinite(value) || std::floor(value) != value) {
                throw InstanceInvalid(what + " must be an integer, got " + std::to_string(value));
            }
            return static_cast<int>(value);
        }

        std::string basename_without_extension(const std::string& pathname) {
            const auto slash = pathname.find_last_of('/');
            auto name = slash == std::string::npos ? pathname : pathname.substr(slash + 1);
            const auto dot = name.find_last_of('.');
            if (dot != std::string::npos && dot > 0) {
                name = name.substr(0, dot);
            }
            return name;
        }

    }  // namespace

    // static
    // 读取.dat文件并构建单级实例
    std::optional<Instance> Instance::make(const std::string& filepath, Rounding rounding) {

        const auto maybe_data = Parser(filepath).parse();
        if (!maybe_data.has_value()) {
            return std::nullopt;
        }
        const auto& parsed = maybe_data.value();

        Data data;
        data.name = basename_without_extension(filepath);
        data.echelons = 1;
        data.rounding = rounding;

        for (size_t n = 0; n < parsed.depot_xcoords.size(); n++) {
            Facility facility;
            facility.x = parsed.depot_xcoords[n];
            facility.y = parsed.depot_ycoords[n];
            facility.capacity = to_integral(parsed.depot_capacities[n], "Capacity of depot " + std::to_string(n));
            facility.opening_cost = parsed.depot_opening_costs[n];
            facility.tier = Tier::SECONDARY;
            data.facilities.push_back(facility);
        }

        for (size_t n = 0; n < parsed.customer_xcoords.size(); n++) {
            Customer customer;
            customer.x = parsed.customer_xcoords[n];
            customer.y = parsed.customer_ycoords[n];
            customer.demand = to_integral(parsed.customer_demands[n], "Demand of customer " + std::to_string(n));
            data.customers.push_back(customer);
        }

        data.secondary_vehicle.capacity = to_integral(parsed.vehicle_capacity, "Vehicle capacity");
        data.secondary_vehicle.fixed_cost = parsed.route_setup_cost;
        data.secondary_vehicle.unit_cost = 1.0;

        return Instance(std::move(data));
    }

    Instance::Instance(Data data) {

        validate(data);

        name = std::move(data.name);
        echelons = data.echelons;
        rounding = data.rounding;
        facilities = std::move(data.facilities);
        primary_vehicle = data.primary_vehicle;
        secondary_vehicle = data.secondary_vehicle;

        const auto facilities_num = static_cast<int>(facilities.size());
        const auto vertices_num = facilities_num + static_cast<int>(data.customers.size());

        xcoords.resize(vertices_num);
        ycoords.resize(vertices_num);
        demands.assign(vertices_num, 0);

        for (int f = 0; f < facilities_num; f++) {
            xcoords[f] = facilities[f].x;
            ycoords[f] = facilities[f].y;
            if (facilities[f].tier == Tier::PRIMARY) {
                primary_facilities.push_back(f);
            } else {
                secondary_facilities.push_back(f);
            }
        }

        for (int c = 0; c < static_cast<int>(data.customers.size()); c++) {
            const auto i = facilities_num + c;
            xcoords[i] = data.customers[c].x;
            ycoords[i] = data.customers[c].y;
            demands[i] = data.customers[c].demand;
            total_demand += demands[i];
        }

        // Precompute the symmetric distance matrix.
        // 预计算对称距离矩阵
        distances.assign(static_cast<size_t>(vertices_num) * static_cast<size_t>(vertices_num), 0.0);
        for (int i = 0; i < vertices_num; i++) {
            for (int j = i + 1; j < vertices_num; j++) {
                auto value = std::sqrt((xcoords[i] - xcoords[j]) * (xcoords[i] - xcoords[j]) +
                                       (ycoords[i] - ycoords[j]) * (ycoords[i] - ycoords[j]));
                if (rounding == Rounding::CEIL) {
                    value = std::ceil(value);
                } else if (rounding == Rounding::ROUND) {
                    value = std::round(value);
                }
                distances[static_cast<size_t>(i) * vertices_num + j] = value;
                distances[static_cast<size_t>(j) * vertices_num + i] = value;
            }
        }

#ifdef VERBOSE
        std::cout << "Instance " << name << ": " << facilities_num << " facilities, " << get_customers_num() << " customers, "
                  << echelons << " echelon(s).\n";
#endif
    }

    void Instance::validate(const Data& data) const {

        if (data.echelons != 1 && data.echelons != 2) {
            throw InstanceInvalid("The number of echelons must be 1 or 2, got " + std::to_string(data.echelons));
        }
        if (data.facilities.empty()) {
            throw InstanceInvalid("The instance has no facilities");
        }
        if (data.customers.empty()) {
            throw InstanceInvalid("The instance has no customers");
        }

        auto primary_num = 0;
        auto secondary_num = 0;
        for (size_t f = 0; f < data.facilities.size(); f++) {
            const auto& facility = data.facilities[f];
            if (!std::isfinite(facility.x) || !std::isfinite(facility.y)) {
                throw InstanceInvalid("Facility " + std::to_string(f) + " has non finite coordinates");
            }
            if (facility.capacity <= 0) {
                throw InstanceInvalid("Facility " + std::to_string(f) + " has non positive capacity " + std::to_string(facility.capacity));
            }
            if (!std::isfinite(facility.opening_cost) || facility.opening_cost < 0.0) {
                throw InstanceInvalid("Facility " + std::to_string(f) + " has invalid opening cost " +
                                      std::to_string(facility.opening_cost));
            }
            if (facility.tier == Tier::PRIMARY) {
                primary_num++;
            } else {
                secondary_num++;
            }
        }

        if (data.echelons == 1 && primary_num > 0) {
            throw InstanceInvalid("A one-echelon instance cannot have primary facilities");
        }
        if (data.echelons == 2 && (primary_num == 0 || secondary_num == 0)) {
            throw InstanceInvalid("A two-echelon instance needs both primary and secondary facilities");
        }

        const auto check_vehicle = [](const Vehicle& vehicle, const std::string& what) {
            if (vehicle.capacity <= 0) {
                throw InstanceInvalid(what + " vehicle has non positive capacity " + std::to_string(vehicle.capacity));
            }
            if (!std::isfinite(vehicle.fixed_cost) || vehicle.fixed_cost < 0.0 || !std::isfinite(vehicle.unit_cost) ||
                vehicle.unit_cost < 0.0) {
                throw InstanceInvalid(what + " vehicle has negative or non finite costs");
            }
        };
        check_vehicle(data.secondary_vehicle, "Secondary");
        if (data.echelons == 2) {
            check_vehicle(data.primary_vehicle, "Primary");
        }

        for (size_t c = 0; c < data.customers.size(); c++) {
            const auto& customer = data.customers[c];
            if (!std::isfinite(customer.x) || !std::isfinite(customer.y)) {
                throw InstanceInvalid("Customer " + std::to_string(c) + " has non finite coordinates");
            }
            if (customer.demand <= 0) {
                throw InstanceInvalid("Customer " + std::to_string(c) + " has non positive demand " + std::to_string(customer.demand));
            }
            if (customer.demand > data.secondary_vehicle.capacity) {
                throw InstanceInvalid("Customer " + std::to_string(c) + " has demand " + std::to_string(customer.demand) +
                                      " exceeding the vehicle capacity " + std::to_string(data.secondary_vehicle.capacity));
            }
        }
    }

}  // namespace clrpsa
