#ifndef _IN_RECAST_CORE_ENUM_H
#define _IN_RECAST_CORE_ENUM_H

#include <recast/core/Exception.h>
#include <ostream>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace recast
{

/*
Enums with string names.  Traits declare the raw enum, which must start at UNKNOWN = 0 and end with NUM_TYPES:

struct CastPolicyTraits
{
    enum _enum : uint8_t
    {
        UNKNOWN = 0,
        THROW,
        IGNORE,

        NUM_TYPES
    };
};

using CastPolicy = Enum<CastPolicyTraits>;

and exactly one cpp file, inside namespace recast, names every value in order:

INIT_RECAST_ENUM( CastPolicy,
    "UNKNOWN",
    "THROW",
    "IGNORE"
);

Unrecognized names and out of range values throw ValueError.
*/
template<typename Traits>
class Enum : public Traits
{
public:
    using EnumV = typename Traits::_enum;
    using UType = std::underlying_type_t<EnumV>;
    using Names = std::vector<std::string>;

    constexpr Enum() : m_value( Traits::UNKNOWN ) {}
    constexpr Enum( EnumV v ) : m_value( v ) {}

    Enum( const char * name ) : m_value( fromName( name ) ) {}
    Enum( const std::string & name ) : m_value( fromName( name ) ) {}
    explicit Enum( UType v ) : m_value( fromValue( v ) ) {}

    //comparisons and switch statements go through the raw enum
    constexpr operator EnumV() const { return m_value; }
    constexpr UType value() const    { return m_value; }

    bool isKnown() const   { return m_value != Traits::UNKNOWN; }
    bool isUnknown() const { return m_value == Traits::UNKNOWN; }

    const std::string & asString() const { return names()[ m_value ]; }

    static constexpr size_t numTypes() { return size_t( Traits::NUM_TYPES ); }

    //defined by INIT_RECAST_ENUM
    static const Names & names();

private:
    static EnumV fromName( const std::string & name )
    {
        static const std::unordered_map<std::string, EnumV> s_byName = []()
        {
            std::unordered_map<std::string, EnumV> byName;
            for( size_t i = 0; i < names().size(); ++i )
                byName.emplace( names()[ i ], EnumV( i ) );
            return byName;
        }();

        auto it = s_byName.find( name );
        if( it == s_byName.end() )
            RECAST_THROW( ValueError, "Unrecognized enum value: " << name << " for enum " << typeid( Traits ).name() );
        return it -> second;
    }

    static EnumV fromValue( UType v )
    {
        if( size_t( v ) >= numTypes() )
            RECAST_THROW( ValueError, "enum value: " << int64_t( v ) << " out of range for enum " << typeid( Traits ).name() );
        return EnumV( v );
    }

    EnumV m_value;
};

template<typename Traits>
std::ostream & operator<<( std::ostream & o, const Enum<Traits> & e )
{
    return o << e.asString();
}

}

#define INIT_RECAST_ENUM(ENUM, ...)                      \
    template<> const ENUM::Names & ENUM::names() {       \
        static const ENUM::Names s_names( { __VA_ARGS__ } ); \
        return s_names;                                  \
    }

#endif
