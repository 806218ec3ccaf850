#ifndef _IN_RECAST_CAST_ALLOWEDTYPES_H
#define _IN_RECAST_CAST_ALLOWEDTYPES_H

#include <recast/engine/StructMetaRegistry.h>
#include <initializer_list>
#include <string>
#include <unordered_set>
#include <vector>

namespace recast
{

//Type names deserialization may instantiate.  An empty set allows nothing beyond what is added with with().
//any() admits every registered type, including types nobody intended to reconstruct from foreign bytes.
//Only use it for trusted input
class AllowedTypes
{
public:
    using Names = std::unordered_set<std::string>;

    AllowedTypes() : m_any( false ) {}
    AllowedTypes( std::initializer_list<std::string> names ) : m_names( names ), m_any( false ) {}
    explicit AllowedTypes( const std::vector<std::string> & names ) : m_names( names.begin(), names.end() ), m_any( false ) {}

    static AllowedTypes any()
    {
        AllowedTypes out;
        out.m_any = true;
        return out;
    }

    bool isAny() const         { return m_any; }
    const Names & names() const { return m_names; }

    bool allows( const std::string & typeName ) const
    {
        return m_any || m_names.find( typeName ) != m_names.end();
    }

    AllowedTypes with( const std::string & typeName ) const
    {
        AllowedTypes out( *this );
        out.m_names.insert( typeName );
        return out;
    }

    //every listed name must be registered, throws TargetTypeNotFound
    void validate( const StructMetaRegistry & registry ) const
    {
        for( auto & name : m_names )
            registry.get( name );
    }

private:
    Names m_names;
    bool  m_any;
};

}

#endif
