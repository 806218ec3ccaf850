#ifndef _IN_RECAST_CAST_SHAPECASTER_H
#define _IN_RECAST_CAST_SHAPECASTER_H

#include <recast/engine/CastExceptions.h>
#include <recast/engine/Struct.h>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace recast
{

//Bound to a single target type.  The target's field list is captured once at construction and every
//cast copies those fields from the source instance, with no policy and no recursion.
//Nested struct values are shared with the source.
//Source fields are matched by name once per source type and cached.  Sources of the target type or one
//derived from it share the target's layout and skip the lookup altogether.
//A source missing a captured field, or holding it with a different type, breaks the caller's contract:
//ShapeMismatch is raised out of a noexcept cast and the process terminates.
class ShapeCaster
{
public:
    ShapeCaster( const StructMetaPtr & target, bool useConstructorPath = false );

    ShapeCaster( const ShapeCaster & ) = delete;
    ShapeCaster & operator=( const ShapeCaster & ) = delete;

    StructPtr cast( const Struct * source ) const noexcept;

    const StructMetaPtr & target() const { return m_target; }
    bool useConstructorPath() const      { return m_useConstructorPath; }
    size_t numFields() const             { return m_fields.size(); }

    //number of unrelated source types resolved so far
    size_t numResolvedSources() const;

private:
    //source field for each target field, same order as m_fields
    using SourceFields = std::vector<const StructField *>;

    struct Resolved
    {
        std::shared_ptr<const StructMeta> source;
        SourceFields                      fields;
    };

    const SourceFields & resolve( const Struct * source ) const;
    SourceFields matchFields( const StructMeta & source ) const;

    StructMetaPtr                   m_target;
    std::vector<const StructField*> m_fields;
    bool                            m_useConstructorPath;

    mutable std::mutex                                    m_mutex;
    mutable std::unordered_map<const StructMeta*,Resolved> m_resolved;
};

}

#endif
