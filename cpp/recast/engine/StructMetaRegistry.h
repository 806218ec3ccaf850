#ifndef _IN_RECAST_ENGINE_STRUCTMETAREGISTRY_H
#define _IN_RECAST_ENGINE_STRUCTMETAREGISTRY_H

#include <recast/engine/Struct.h>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace recast
{

//Name -> StructMeta lookup used to resolve cast targets by name and type tags in serialized data.
//Registration and lookup are guarded, registered metas are immutable
class StructMetaRegistry
{
public:
    StructMetaRegistry();

    static StructMetaRegistry & instance();

    //throws ValueError if a different meta is already registered under the same name
    void registerMeta( const StructMetaPtr & meta );

    //throws TargetTypeNotFound
    StructMetaPtr get( const std::string & name ) const;

    //returns null if not found
    StructMetaPtr lookup( const std::string & name ) const;

    bool exists( const std::string & name ) const { return lookup( name ) != nullptr; }

    std::vector<std::string> typeNames() const;

private:
    using Metas = std::unordered_map<std::string,StructMetaPtr>;

    mutable std::mutex m_mutex;
    Metas              m_metas;
};

}

#endif
