#pragma once
#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility>

namespace mecs::detail {

template <typename MapIt>
struct KeyProjection {
    static const auto& apply(const MapIt& it) { return it->first; }
};

template <typename MapIt>
struct ValueProjection {
    static auto& apply(const MapIt& it) { return it->second; }
};

/**
 * @brief Forward iterator exposing only the keys or only the values of a map iterator.
 */
template <typename MapIt, template <typename> class Projection>
class ProjectionIterator {
public:
    using reference = decltype(Projection<MapIt>::apply(std::declval<const MapIt&>()));
    using value_type = std::remove_cv_t<std::remove_reference_t<reference>>;
    using pointer = std::remove_reference_t<reference>*;
    using difference_type = std::ptrdiff_t;
    using iterator_category = std::forward_iterator_tag;

    ProjectionIterator() = default;
    explicit ProjectionIterator(MapIt it) : it_(it) {}

    reference operator*() const { return Projection<MapIt>::apply(it_); }
    pointer operator->() const { return &Projection<MapIt>::apply(it_); }

    ProjectionIterator& operator++() {
        ++it_;
        return *this;
    }

    ProjectionIterator operator++(int) {
        ProjectionIterator tmp = *this;
        ++it_;
        return tmp;
    }

    bool operator==(const ProjectionIterator& o) const { return it_ == o.it_; }
    bool operator!=(const ProjectionIterator& o) const { return it_ != o.it_; }

private:
    MapIt it_{};
};

/**
 * @brief A [begin, end) pair usable in range-for. Restartable: begin() may be called again.
 */
template <typename It>
class Range {
public:
    using iterator_type = It;

    Range(It first, It last) : first_(first), last_(last) {}

    It begin() const { return first_; }
    It end() const { return last_; }
    bool empty() const { return first_ == last_; }
    size_t size() const { return static_cast<size_t>(std::distance(first_, last_)); }

private:
    It first_;
    It last_;
};

template <typename Map>
using KeyRange = Range<ProjectionIterator<typename Map::const_iterator, KeyProjection>>;

template <typename Map>
using ValueRange = Range<ProjectionIterator<typename Map::iterator, ValueProjection>>;

template <typename Map>
using ConstValueRange = Range<ProjectionIterator<typename Map::const_iterator, ValueProjection>>;

} // namespace mecs::detail
