#pragma once

#include <optional>
#include <string>
#include <vector>

#include "isophote.h"

namespace ef {

// Columnar export of an isophote list
struct IsophoteTable
{
    std::vector<std::string> names;
    std::vector<std::vector<double>> columns;

    inline size_t columnCount() const { return names.size(); }
    inline size_t rowCount() const
    {
        return columns.empty() ? 0 : columns.front().size();
    }

    // Throws std::out_of_range for an unknown name
    const std::vector<double>& column(const std::string& name) const;
};

// Ordered collection of isophotes. Not necessarily sorted, see sort().
//
// NOTE:
// 1. Copies, slices and concatenations share the isophote samples, which are
// never modified.
class IsophoteList
{
public:
    enum class ColumnSet
    {
        Main, // The 18 classic columns, angles in degrees
        All   // Every field, angles in degrees
    };

    IsophoteList() = default;
    explicit IsophoteList(std::vector<Isophote> isophotes);

    /// Properties
    inline size_t size() const { return m_isophotes.size(); }
    inline bool empty() const { return m_isophotes.empty(); }
    inline const std::vector<Isophote>& isophotes() const
    {
        return m_isophotes;
    }

    // Negative indices count from the back. Throws std::out_of_range.
    const Isophote& operator[](int index) const;
    inline const Isophote& front() const { return m_isophotes.front(); }
    inline const Isophote& back() const { return m_isophotes.back(); }

    inline auto begin() const { return m_isophotes.cbegin(); }
    inline auto end() const { return m_isophotes.cend(); }

    /// Modifiers
    void append(Isophote isophote);
    // Negative indices count from the back, as for operator[].
    void insert(int index, Isophote isophote);
    void erase(int index);
    void extend(const IsophoteList& other);
    IsophoteList& operator+=(const IsophoteList& other);
    // Ascending sma
    void sort();

    // Slice with Python semantics: [start, stop) taken every step, negative
    // bounds count from the back, missing bounds span the whole list.
    IsophoteList slice(std::optional<int> start, std::optional<int> stop,
                       int step = 1) const;

    /// Queries
    // Nearest sma, ties resolved towards the smaller sma. Throws
    // std::out_of_range when the list is empty.
    const Isophote& closest(double sma) const;

    std::vector<double> column(IsophoteField field) const;
    std::vector<std::shared_ptr<const EllipseSample>> samples() const;

    // Every field name, plus "sample"
    static std::vector<std::string> names();

    /// Export
    IsophoteTable toTable(ColumnSet set = ColumnSet::Main) const;
    // Field names as listed by names(), or the Main column names. Throws
    // std::invalid_argument for an unknown or non numeric name.
    IsophoteTable toTable(const std::vector<std::string>& names) const;

private:
    size_t normalizeIndex(int index) const;

private:
    std::vector<Isophote> m_isophotes;
};

IsophoteList operator+(const IsophoteList& lhs, const IsophoteList& rhs);

} // namespace ef
