// Copyright (c) 2015-2021 Daniel Cooke
// Use of this source code is governed by the MIT license that can be found in the LICENSE file.

#ifndef sequence_region_hpp
#define sequence_region_hpp

#include <cstddef>
#include <stdexcept>
#include <string>
#include <ostream>

namespace polyscan {

/*
    Represents a region of a single sequence.
    begin and end positions are zero-indexed half open indices [begin,end).
*/
class SequenceRegion
{
public:
    using Position = std::size_t;
    using Size     = Position;
    
    class BadRegion;
    
    SequenceRegion() = default;
    
    explicit SequenceRegion(Position begin, Position end);
    
    SequenceRegion(const SequenceRegion&)            = default;
    SequenceRegion& operator=(const SequenceRegion&) = default;
    SequenceRegion(SequenceRegion&&)                 = default;
    SequenceRegion& operator=(SequenceRegion&&)      = default;
    
    ~SequenceRegion() = default;
    
    Position begin() const noexcept { return begin_; }
    Position end() const noexcept { return end_; }
    
private:
    Position begin_ = 0, end_ = 0;
};

class SequenceRegion::BadRegion : public std::logic_error
{
public:
    using Position = SequenceRegion::Position;
    
    BadRegion(Position begin, Position end);
    
    virtual ~BadRegion() override = default;
    
    Position begin() const noexcept { return begin_; }
    Position end() const noexcept  { return end_; }
    
private:
    Position begin_, end_;
};

inline SequenceRegion::SequenceRegion(const Position begin, const Position end)
: begin_ {begin}
, end_ {end}
{
    if (end < begin) throw BadRegion {begin, end};
}

inline SequenceRegion::BadRegion::BadRegion(const Position begin, const Position end)
: std::logic_error {"BadRegion: end " + std::to_string(end) + " precedes begin " + std::to_string(begin)}
, begin_ {begin}
, end_ {end}
{}

inline bool is_empty(const SequenceRegion& region) noexcept
{
    return region.begin() == region.end();
}

inline SequenceRegion::Size size(const SequenceRegion& region) noexcept
{
    return region.end() - region.begin();
}

inline bool operator==(const SequenceRegion& lhs, const SequenceRegion& rhs) noexcept
{
    return lhs.begin() == rhs.begin() && lhs.end() == rhs.end();
}

inline bool operator!=(const SequenceRegion& lhs, const SequenceRegion& rhs) noexcept
{
    return !(lhs == rhs);
}

inline bool operator<(const SequenceRegion& lhs, const SequenceRegion& rhs) noexcept
{
    return lhs.begin() < rhs.begin() || (lhs.begin() == rhs.begin() && lhs.end() < rhs.end());
}

inline bool contains(const SequenceRegion& lhs, const SequenceRegion& rhs) noexcept
{
    return lhs.begin() <= rhs.begin() && rhs.end() <= lhs.end();
}

// The region spanning all of a sequence of the given length.
inline SequenceRegion full_region(const SequenceRegion::Size length) noexcept
{
    return SequenceRegion {0, length};
}

inline std::string to_string(const SequenceRegion& region)
{
    return std::to_string(region.begin()) + '-' + std::to_string(region.end());
}

inline std::ostream& operator<<(std::ostream& os, const SequenceRegion& region)
{
    os << to_string(region);
    return os;
}

} // namespace polyscan

#endif
