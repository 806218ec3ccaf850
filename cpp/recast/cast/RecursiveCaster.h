#ifndef _IN_RECAST_CAST_RECURSIVECASTER_H
#define _IN_RECAST_CAST_RECURSIVECASTER_H

#include <recast/cast/CastPolicy.h>
#include <recast/cast/Diagnostics.h>
#include <recast/engine/CastExceptions.h>
#include <recast/engine/Dictionary.h>
#include <recast/engine/Struct.h>
#include <recast/engine/StructMetaRegistry.h>
#include <string>
#include <unordered_set>

namespace recast
{

/*
Field-by-field, type-aware conversion of a source record into a target struct type.

Source fields are visited in insertion order.  Each is matched by name against the target's declared fields:
primitive values are stored with only the range-checked widening needed for the field's C type,
nested dictionaries recurse into STRUCT fields with the same settings, vectors are converted element-wise
for ARRAY fields and GENERIC fields take the raw value as-is.  Names matching a static field are skipped.
Anything else is handled by the CastPolicy.

useConstructorPath selects StructMeta::create() ( defaults applied ) over StructMeta::createUninitialized().

Properties ( all optional ):
    policy          - string, THROW | IGNORE | DYNAMIC_ASSIGN, default THROW
    use_constructor - bool, default false
    detect_cycles   - bool, default true
*/
class RecursiveCaster
{
public:
    RecursiveCaster( CastPolicy policy = CastPolicy::THROW, bool useConstructorPath = false,
                     DiagnosticSink sink = DiagnosticSink() );
    RecursiveCaster( const Dictionary & properties, DiagnosticSink sink = DiagnosticSink() );

    StructPtr cast( const Dictionary & source, const StructMetaPtr & target ) const;
    StructPtr cast( const Struct * source, const StructMetaPtr & target ) const;

    //target resolved by name, throws TargetTypeNotFound
    StructPtr cast( const Dictionary & source, const std::string & targetType,
                    const StructMetaRegistry & registry = StructMetaRegistry::instance() ) const;
    StructPtr cast( const Struct * source, const std::string & targetType,
                    const StructMetaRegistry & registry = StructMetaRegistry::instance() ) const;

    CastPolicy policy() const       { return m_policy; }
    bool useConstructorPath() const { return m_useConstructorPath; }
    bool detectCycles() const       { return m_detectCycles; }

    void setDetectCycles( bool detectCycles ) { m_detectCycles = detectCycles; }

private:
    using Visited = std::unordered_set<const Dictionary *>;

    StructPtr castImpl( const Dictionary & source, const std::string & sourceType, const StructMetaPtr & target, Visited & visited ) const;

    void assignField( Struct * s, const StructField & field, const StructMeta & target,
                      const Dictionary::Value & value, Visited & visited ) const;

    template<typename T>
    T convertValue( const Dictionary::Value & value, const RecastType & type, const std::string & fieldName,
                    const StructMeta & target, Visited & visited ) const;

    void emit( const CastDiagnostic & diag ) const;

    CastPolicy     m_policy;
    bool           m_useConstructorPath;
    bool           m_detectCycles;
    DiagnosticSink m_sink;
};

StructPtr recursiveCast( const Dictionary & source, const StructMetaPtr & target, bool useConstructorPath = false,
                         CastPolicy policy = CastPolicy::THROW, const DiagnosticSink & sink = DiagnosticSink() );
StructPtr recursiveCast( const Dictionary & source, const std::string & targetType, bool useConstructorPath = false,
                         CastPolicy policy = CastPolicy::THROW, const DiagnosticSink & sink = DiagnosticSink() );
StructPtr recursiveCast( const Struct * source, const StructMetaPtr & target, bool useConstructorPath = false,
                         CastPolicy policy = CastPolicy::THROW, const DiagnosticSink & sink = DiagnosticSink() );
StructPtr recursiveCast( const Struct * source, const std::string & targetType, bool useConstructorPath = false,
                         CastPolicy policy = CastPolicy::THROW, const DiagnosticSink & sink = DiagnosticSink() );

}

#endif
