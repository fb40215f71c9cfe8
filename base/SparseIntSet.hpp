// 稀疏整数集合 (Sparse Integer Set)
// O(1)插入、删除、查询，元素连续存储便于遍历和随机抽样
#ifndef _CLRPSA_SPARSEINTSET_HPP_
#define _CLRPSA_SPARSEINTSET_HPP_

#include <cassert>
#include <vector>

namespace clrpsa {

    // Set of integers in [0, entries_num) supporting constant time insertion, removal and membership queries.
    // 稀疏整数集合类
    //
    // 数据结构：
    // - positions: 每个值在elements中的位置（不存在时为-1）
    // - elements: 实际元素，用于遍历和按下标随机选择
    //
    // Removal swaps the removed element with the last one, so the iteration order depends only on the sequence of operations.
    // 删除时与最后一个元素交换
    //
    // Used by the Solution to track the route slots in use.
    // 用于Solution记录正在使用的路径槽位
    class SparseIntSet {

    public:
        explicit SparseIntSet(unsigned int entries_num = 0) : positions(entries_num, -1) { }

        // 插入元素（带重复检查）
        inline void insert(int value) {
            if (!contains(value)) {
                insert_without_checking_existance(value);
            }
        }

        // 插入元素（调用者保证元素不存在）
        inline void insert_without_checking_existance(int value) {
            if (value >= static_cast<int>(positions.size())) {
                positions.resize(value + 1, -1);
            }
            assert(positions[value] == -1);
            positions[value] = static_cast<int>(elements.size());
            elements.push_back(value);
        }

        // 删除元素（不存在时无操作）
        inline void erase(int value) {
            if (!contains(value)) {
                return;
            }
            const auto position = positions[value];
            const auto last = elements.back();
            elements[position] = last;
            positions[last] = position;
            elements.pop_back();
            positions[value] = -1;
        }

        inline bool contains(int value) const {
            return value >= 0 && value < static_cast<int>(positions.size()) && positions[value] != -1;
        }

        // 清空集合，只遍历实际存在的元素
        void clear() {
            for (auto value : elements) {
                positions[value] = -1;
            }
            elements.clear();
        }

        const std::vector<int>& get_elements() const {
            return elements;
        }

        // Returns the element stored at `index`, with index in [0, size()).
        // 按下标访问元素（用于随机抽样）
        inline int at(int index) const {
            assert(index >= 0 && index < static_cast<int>(elements.size()));
            return elements[index];
        }

        unsigned int size() const {
            return static_cast<unsigned int>(elements.size());
        }

        bool empty() const {
            return elements.empty();
        }

    private:
        std::vector<int> positions;  // 值 -> 下标
        std::vector<int> elements;   // 实际元素列表
    };

}  // namespace clrpsa

#endif
