#include "isophotelist.h"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>
#include <utility>

#include <glog/logging.h>

#include <efCore/ContainerUtils>
#include <efCore/Math>

namespace ef {

namespace {

struct MainColumn
{
    const char* name;
    IsophoteField field;
};

constexpr std::array<MainColumn, 18> kMainColumns{{
    {"sma", IsophoteField::Sma},
    {"intens", IsophoteField::Intens},
    {"intens_err", IsophoteField::IntErr},
    {"ellipticity", IsophoteField::Eps},
    {"ellipticity_err", IsophoteField::EllipErr},
    {"pa", IsophoteField::Pa},
    {"pa_err", IsophoteField::PaErr},
    {"grad", IsophoteField::Grad},
    {"grad_error", IsophoteField::GradError},
    {"grad_rerror", IsophoteField::GradRError},
    {"x0", IsophoteField::X0},
    {"x0_err", IsophoteField::X0Err},
    {"y0", IsophoteField::Y0},
    {"y0_err", IsophoteField::Y0Err},
    {"ndata", IsophoteField::Ndata},
    {"flag", IsophoteField::Nflag},
    {"niter", IsophoteField::Niter},
    {"stop_code", IsophoteField::StopCode},
}};

constexpr char kSampleName[]{"sample"};

std::optional<IsophoteField> findColumn(const std::string& name)
{
    if (const auto field = fieldFromName(name)) {
        return field;
    }

    const auto found =
        std::find_if(kMainColumns.cbegin(), kMainColumns.cend(),
                     [&name](const MainColumn& col) { return name == col.name; });
    if (found != kMainColumns.cend()) {
        return found->field;
    }

    return {};
}

} // namespace

///------- IsophoteTable starts from here
const std::vector<double>& IsophoteTable::column(const std::string& name) const
{
    const int pos = con::FindPos(names, name);
    if (pos < 0) {
        throw std::out_of_range(std::format("No column named {}.", name));
    }

    return columns[pos];
}

///------- IsophoteList starts from here
IsophoteList::IsophoteList(std::vector<Isophote> isophotes)
    : m_isophotes(std::move(isophotes))
{
}

const Isophote& IsophoteList::operator[](int index) const
{
    return m_isophotes[normalizeIndex(index)];
}

void IsophoteList::append(Isophote isophote)
{
    m_isophotes.push_back(std::move(isophote));
}

void IsophoteList::insert(int index, Isophote isophote)
{
    const int n = static_cast<int>(size());
    const int pos = std::clamp(index < 0 ? index + n : index, 0, n);
    con::Insert(m_isophotes, static_cast<size_t>(pos), std::move(isophote));
}

void IsophoteList::erase(int index)
{
    con::Erase(m_isophotes, normalizeIndex(index));
}

void IsophoteList::extend(const IsophoteList& other)
{
    // Copy first, other may be this list
    const std::vector<Isophote> tail = other.m_isophotes;
    m_isophotes.insert(m_isophotes.end(), tail.cbegin(), tail.cend());
}

IsophoteList& IsophoteList::operator+=(const IsophoteList& other)
{
    extend(other);
    return *this;
}

void IsophoteList::sort()
{
    std::stable_sort(m_isophotes.begin(), m_isophotes.end(),
                     [](const Isophote& a, const Isophote& b) {
                         return a.sma() < b.sma();
                     });
}

IsophoteList IsophoteList::slice(std::optional<int> start,
                                 std::optional<int> stop, int step) const
{
    if (step == 0) {
        throw std::invalid_argument("Slice step cannot be zero.");
    }

    const int n = static_cast<int>(size());
    const auto adjust = [n, step](std::optional<int> index, int fallback) {
        if (!index.has_value()) {
            return fallback;
        }

        int i = index.value();
        if (i < 0) {
            i += n;
        }
        return step > 0 ? std::clamp(i, 0, n) : std::clamp(i, -1, n - 1);
    };

    IsophoteList result;
    if (step > 0) {
        const int first = adjust(start, 0);
        const int last = adjust(stop, n);
        for (int i{first}; i < last; i += step) {
            result.m_isophotes.push_back(m_isophotes[i]);
        }
    }
    else {
        const int first = adjust(start, n - 1);
        const int last = adjust(stop, -1);
        for (int i{first}; i > last; i += step) {
            result.m_isophotes.push_back(m_isophotes[i]);
        }
    }

    return result;
}

const Isophote& IsophoteList::closest(double sma) const
{
    if (empty()) {
        throw std::out_of_range("Empty isophote list.");
    }

    size_t best{0};
    double bestDistance{kInfDouble};
    for (size_t i{0}; i < size(); ++i) {
        const double candidate = m_isophotes[i].sma();
        const double distance = std::abs(candidate - sma);
        if (distance < bestDistance ||
            (distance == bestDistance && candidate < m_isophotes[best].sma())) {
            best = i;
            bestDistance = distance;
        }
    }

    return m_isophotes[best];
}

std::vector<double> IsophoteList::column(IsophoteField field) const
{
    std::vector<double> values;
    values.reserve(size());
    for (const auto& isophote : m_isophotes) {
        values.push_back(isophote.value(field));
    }

    return values;
}

std::vector<std::shared_ptr<const EllipseSample>> IsophoteList::samples() const
{
    std::vector<std::shared_ptr<const EllipseSample>> samples;
    samples.reserve(size());
    for (const auto& isophote : m_isophotes) {
        samples.push_back(isophote.sample());
    }

    return samples;
}

std::vector<std::string> IsophoteList::names()
{
    std::vector<std::string> names;
    names.reserve(kIsophoteFieldCount + 1);
    for (size_t i{0}; i < kIsophoteFieldCount; ++i) {
        names.emplace_back(fieldName(static_cast<IsophoteField>(i)));
    }
    names.emplace_back(kSampleName);

    return names;
}

IsophoteTable IsophoteList::toTable(ColumnSet set) const
{
    std::vector<std::string> names;
    switch (set) {
        case ColumnSet::Main:
            for (const auto& col : kMainColumns) {
                names.emplace_back(col.name);
            }
            break;
        case ColumnSet::All:
            names = IsophoteList::names();
            names.pop_back(); // sample
            break;
        default:
            LOG(FATAL) << "Unknown column set.";
            break;
    }

    return toTable(names);
}

IsophoteTable IsophoteList::toTable(const std::vector<std::string>& names) const
{
    IsophoteTable table;
    for (const auto& name : names) {
        const auto field = findColumn(name);
        if (!field.has_value()) {
            throw std::invalid_argument(
                std::format("No numeric isophote field named {}.", name));
        }

        auto values = column(field.value());
        if (isAngleField(field.value())) {
            std::transform(values.begin(), values.end(), values.begin(),
                           [](double rad) { return math::radToDeg(rad); });
        }

        table.names.push_back(name);
        table.columns.push_back(std::move(values));
    }

    return table;
}

size_t IsophoteList::normalizeIndex(int index) const
{
    const int n = static_cast<int>(size());
    const int i = index < 0 ? index + n : index;
    if (i < 0 || i >= n) {
        throw std::out_of_range(
            std::format("Isophote index {} out of range for size {}.", index,
                        n));
    }

    return static_cast<size_t>(i);
}

IsophoteList operator+(const IsophoteList& lhs, const IsophoteList& rhs)
{
    IsophoteList result{lhs};
    result.extend(rhs);
    return result;
}

} // namespace ef
