// 美化输出类 - 用于格式化打印表格数据
// 支持自动对齐、高亮行、周期性打印表头
#ifndef _CLRPSA_PRETTYPRINTER_HPP_
#define _CLRPSA_PRETTYPRINTER_HPP_

#include <iomanip>
#include <iostream>
#include <string>
#include <type_traits>
#include <vector>

namespace clrpsa {

    // Table printer used to report the optimization progress.
    // 表格打印类，用于输出优化进度
    class PrettyPrinter {

    public:
        // 字段类 - 定义表格的一列
        class Field {
        public:
            enum Type { INTEGER, REAL, STRING };

            Field(std::string name_, Type type_ = Type::REAL, int max_width_ = 8, int precision_ = 2)
                : name(std::move(name_)), type(type_), max_width(max_width_), precision(precision_) { }

            const std::string& get_name() const {
                return name;
            }
            Type get_type() const {
                return type;
            }
            int get_max_width() const {
                return max_width;
            }
            int get_precision() const {
                return precision;
            }

        private:
            std::string name;
            Type type;
            int max_width;
            int precision;  // 浮点数精度
        };

        // ANSI styles.
        // 终端样式（ANSI转义码）
        enum Style { NONE = 0, BOLD = 1, FOREGROUND_RED = 31, FOREGROUND_GREEN = 32, FOREGROUND_YELLOW = 33 };

        explicit PrettyPrinter(std::vector<Field> args_, std::ostream& out_ = std::cout) : args(std::move(args_)), out(out_) { }

        // Prints a row. The header is printed again every `max_header_count` rows.
        // 打印一行数据，每隔max_header_count行重新打印表头
        template <typename... Values>
        void print(Values... values) {

            if (sizeof...(values) != args.size()) {
                out << "Values do not correspond to headers\n";
                return;
            }

            if (!header_count) {
                header_count = max_header_count;
                print_header();
            }
            header_count--;

            if (style != NONE) {
                out << "\033[" << style << "m";
            }

            auto n = 0u;
            (just_print(values, args[n++]), ...);

            if (style != NONE) {
                out << "\033[0m";
            }
            out << "\n";
        }

        // 打印通知消息
        void notify(const std::string& message) {
            out << "\n" << message << "\n\n";
        }

        void set_style(Style style_) {
            style = style_;
        }

        void unset_style() {
            style = NONE;
        }

    private:
        void print_header() {
            out << "\n\033[1m";
            for (const auto& header : args) {
                out << " " << std::setw(header.get_max_width()) << header.get_name() << " ";
            }
            out << "\033[0m\n";
        }

        // 根据字段类型格式化单个值
        template <typename T>
        void just_print(const T& value, const Field& header) {
            out << " " << std::fixed << std::setprecision(header.get_precision()) << std::setw(header.get_max_width());
            if constexpr (std::is_arithmetic_v<T>) {
                if (header.get_type() == Field::INTEGER) {
                    out << static_cast<long>(value);
                } else {
                    out << static_cast<double>(value);
                }
            } else {
                out << value;
            }
            out << " " << std::setprecision(10) << std::defaultfloat;
        }

        std::vector<Field> args;
        std::ostream& out;
        int max_header_count = 20;  // 每隔多少行重新打印表头
        int header_count = 0;
        Style style = NONE;
    };

}  // namespace clrpsa

#endif
