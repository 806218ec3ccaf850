#ifndef _IN_RECAST_ENGINE_CASTEXCEPTIONS_H
#define _IN_RECAST_ENGINE_CASTEXCEPTIONS_H

#include <recast/core/Exception.h>
#include <string>

namespace recast
{

//recoverable cast failures, all propagate unmodified from nested casts to the caller
RECAST_DECLARE_EXCEPTION( CastError,          RuntimeException )
RECAST_DECLARE_EXCEPTION( TargetTypeNotFound, CastError )
RECAST_DECLARE_EXCEPTION( MalformedSource,    CastError )
RECAST_DECLARE_EXCEPTION( FieldTypeMismatch,  CastError )
RECAST_DECLARE_EXCEPTION( CyclicGraph,        CastError )
RECAST_DECLARE_EXCEPTION( RelabelFailed,      CastError )

//source field has no counterpart on the target under the THROW policy
class UnknownFieldRejected : public CastError
{
public:
    UnknownFieldRejected( const char * exType, const std::string & r, const char * file, const char * func, int line,
                          const std::string & fieldName, const std::string & sourceType, const std::string & targetType ) :
        CastError( exType, r, file, func, line ),
        m_fieldName( fieldName ),
        m_sourceType( sourceType ),
        m_targetType( targetType )
    {}

    const std::string & fieldName() const  { return m_fieldName; }
    const std::string & sourceType() const { return m_sourceType; }
    const std::string & targetType() const { return m_targetType; }

private:
    std::string m_fieldName;
    std::string m_sourceType;
    std::string m_targetType;
};

//contract violation of a precompiled shape, not recoverable
RECAST_DECLARE_EXCEPTION( ShapeMismatch, AssertionError )

}

#endif
