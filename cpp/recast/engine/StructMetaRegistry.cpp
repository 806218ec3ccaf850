#include <recast/engine/CastExceptions.h>
#include <recast/engine/StructMetaRegistry.h>
#include <algorithm>

namespace recast
{

StructMetaRegistry::StructMetaRegistry()
{
}

StructMetaRegistry & StructMetaRegistry::instance()
{
    static StructMetaRegistry s_instance;
    return s_instance;
}

void StructMetaRegistry::registerMeta( const StructMetaPtr & meta )
{
    RECAST_TRUE_OR_THROW( meta != nullptr, ValueError, "Attempted to register a null StructMeta" );

    std::lock_guard<std::mutex> guard( m_mutex );
    auto rv = m_metas.emplace( meta -> name(), meta );
    if( !rv.second && rv.first -> second != meta )
        RECAST_THROW( ValueError, "Attempted to register struct type " << meta -> name() << " more than once" );
}

StructMetaPtr StructMetaRegistry::lookup( const std::string & name ) const
{
    std::lock_guard<std::mutex> guard( m_mutex );
    auto it = m_metas.find( name );
    return it == m_metas.end() ? nullptr : it -> second;
}

StructMetaPtr StructMetaRegistry::get( const std::string & name ) const
{
    auto meta = lookup( name );
    if( !meta )
        RECAST_THROW( TargetTypeNotFound, "Struct type \"" << name << "\" is not registered" );
    return meta;
}

std::vector<std::string> StructMetaRegistry::typeNames() const
{
    std::vector<std::string> out;
    {
        std::lock_guard<std::mutex> guard( m_mutex );
        out.reserve( m_metas.size() );
        for( auto & entry : m_metas )
            out.emplace_back( entry.first );
    }
    std::sort( out.begin(), out.end() );
    return out;
}

}
