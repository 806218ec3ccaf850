#include <recast/cast/RecursiveCaster.h>
#include <recast/cast/StructToDictionary.h>
#include <gtest/gtest.h>
#include <sstream>

using namespace recast;

namespace
{

struct TestTypes
{
    TestTypes()
    {
        point = std::make_shared<StructMeta>( "Point", StructMeta::Fields{
                makeStructField( RecastType::INT32(), "x" ),
                makeStructField( RecastType::INT32(), "y" ) } );

        auto pointType = std::make_shared<RecastStructType>( point );
        line = std::make_shared<StructMeta>( "Line", StructMeta::Fields{
                makeStructField( RecastType::STRING(), "name" ),
                makeStructField( pointType, "start" ),
                makeStructField( pointType, "end" ),
                makeStructField( RecastArrayType::create( RecastType::STRING() ), "tags" ),
                makeStructField( RecastArrayType::create( RecastType::BOOL() ), "flags" ),
                makeStructField( RecastArrayType::create( pointType ), "points" ),
                makeStructField( RecastType::GENERIC(), "extra" ),
                makeStructField( RecastType::DOUBLE(), "length" ) } );

        small = std::make_shared<StructMeta>( "Small", StructMeta::Fields{
                makeStructField( RecastType::INT8(), "i8" ),
                makeStructField( RecastType::UINT16(), "u16" ),
                makeStructField( RecastType::INT64(), "i64" ) } );

        Dictionary statics;
        statics.insert( "VERSION", 3 );
        versioned = std::make_shared<StructMeta>( "Versioned", StructMeta::Fields{
                makeStructField( RecastType::INT32(), "value" ) }, nullptr, statics );

        wrapper = std::make_shared<StructMeta>( "Wrapper", StructMeta::Fields{
                makeStructField( pointType, "inner" ) } );

        registry.registerMeta( point );
        registry.registerMeta( line );
    }

    StructMetaPtr      point;
    StructMetaPtr      line;
    StructMetaPtr      small;
    StructMetaPtr      versioned;
    StructMetaPtr      wrapper;
    StructMetaRegistry registry;
};

DictionaryPtr makePoint( int32_t x, int32_t y )
{
    auto d = std::make_shared<Dictionary>();
    d -> insert( "x", x );
    d -> insert( "y", y );
    return d;
}

Dictionary makeLine()
{
    Dictionary::Vector tags;
    tags.emplace_back( Dictionary::Value( std::string( "red" ) ) );
    tags.emplace_back( Dictionary::Value( std::string( "thick" ) ) );

    Dictionary::Vector flags;
    flags.emplace_back( Dictionary::Value( true ) );
    flags.emplace_back( Dictionary::Value( false ) );

    Dictionary::Vector points;
    points.emplace_back( Dictionary::Value( makePoint( 1, 1 ) ) );
    points.emplace_back( Dictionary::Value( makePoint( 2, 4 ) ) );

    auto extra = std::make_shared<Dictionary>();
    extra -> insert( "anything", "goes" );

    Dictionary d;
    d.insert( "name", "diagonal" );
    d.insert( "start", makePoint( 0, 0 ) );
    d.insert( "end", makePoint( 3, 4 ) );
    d.insert( "tags", tags );
    d.insert( "flags", flags );
    d.insert( "points", points );
    d.insert( "extra", extra );
    d.insert( "length", 5 );
    return d;
}

}

TEST( RecursiveCasterTest, test_nested_cast )
{
    TestTypes types;
    auto line = recursiveCast( makeLine(), types.line );

    ASSERT_EQ( line -> meta(), types.line.get() );
    ASSERT_TRUE( line -> allFieldsSet() );

    auto & meta = *types.line;
    ASSERT_EQ( meta.field( "name" ) -> value<std::string>( line.get() ), "diagonal" );
    ASSERT_EQ( meta.field( "length" ) -> value<double>( line.get() ), 5.0 );

    auto & end = meta.field( "end" ) -> value<StructPtr>( line.get() );
    ASSERT_EQ( end -> meta(), types.point.get() );
    ASSERT_EQ( types.point -> field( "x" ) -> value<int32_t>( end.get() ), 3 );
    ASSERT_EQ( types.point -> field( "y" ) -> value<int32_t>( end.get() ), 4 );

    ASSERT_EQ( meta.field( "tags" ) -> value<std::vector<std::string>>( line.get() ), ( std::vector<std::string>{ "red", "thick" } ) );
    ASSERT_EQ( meta.field( "flags" ) -> value<std::vector<uint8_t>>( line.get() ), ( std::vector<uint8_t>{ 1, 0 } ) );

    auto & points = meta.field( "points" ) -> value<std::vector<StructPtr>>( line.get() );
    ASSERT_EQ( points.size(), 2u );
    ASSERT_EQ( types.point -> field( "y" ) -> value<int32_t>( points[1].get() ), 4 );

    auto & extra = meta.field( "extra" ) -> value<GenericValue>( line.get() );
    ASSERT_EQ( std::get<DictionaryPtr>( extra._data ) -> get<std::string>( "anything" ), "goes" );
}

TEST( RecursiveCasterTest, test_struct_source_round_trip )
{
    TestTypes types;
    auto line = recursiveCast( makeLine(), types.line );

    auto copy = recursiveCast( line.get(), types.line );
    ASSERT_NE( copy.get(), line.get() );

    //nested values are rebuilt, not shared
    ASSERT_NE( types.line -> field( "start" ) -> value<StructPtr>( copy.get() ).get(),
               types.line -> field( "start" ) -> value<StructPtr>( line.get() ).get() );

    ASSERT_EQ( *structToDictionary( copy.get() ), *structToDictionary( line.get() ) );
}

TEST( RecursiveCasterTest, test_unknown_field_throw )
{
    TestTypes types;
    Dictionary d = *makePoint( 1, 2 );
    d.insert( "z", 3 );

    try
    {
        recursiveCast( d, types.point );
        FAIL() << "expected UnknownFieldRejected";
    }
    catch( const UnknownFieldRejected & err )
    {
        ASSERT_EQ( err.fieldName(), "z" );
        ASSERT_EQ( err.sourceType(), "Dictionary" );
        ASSERT_EQ( err.targetType(), "Point" );
    }

    //struct sources report their own type name
    auto line = recursiveCast( makeLine(), types.line );
    try
    {
        recursiveCast( line.get(), types.point );
        FAIL() << "expected UnknownFieldRejected";
    }
    catch( const UnknownFieldRejected & err )
    {
        ASSERT_EQ( err.fieldName(), "name" );
        ASSERT_EQ( err.sourceType(), "Line" );
        ASSERT_EQ( err.targetType(), "Point" );
    }
}

TEST( RecursiveCasterTest, test_nested_errors_propagate )
{
    TestTypes types;
    Dictionary d = makeLine();
    auto badEnd = makePoint( 3, 4 );
    badEnd -> insert( "w", 1 );
    d.update( "end", badEnd );

    try
    {
        recursiveCast( d, types.line );
        FAIL() << "expected UnknownFieldRejected";
    }
    catch( const UnknownFieldRejected & err )
    {
        ASSERT_EQ( err.fieldName(), "w" );
        ASSERT_EQ( err.targetType(), "Point" );
    }

    //an element of a struct array failing aborts the whole cast
    Dictionary::Vector points;
    points.emplace_back( Dictionary::Value( makePoint( 1, 1 ) ) );
    points.emplace_back( Dictionary::Value( std::string( "not a point" ) ) );
    d = makeLine();
    d.update( "points", points );
    ASSERT_THROW( recursiveCast( d, types.line ), FieldTypeMismatch );
}

TEST( RecursiveCasterTest, test_ignore_policy )
{
    TestTypes types;
    Dictionary d = *makePoint( 1, 2 );
    d.insert( "z", 3 );

    auto p = recursiveCast( d, types.point, false, CastPolicy::IGNORE );
    ASSERT_EQ( *structToDictionary( p.get() ), *makePoint( 1, 2 ) );
}

TEST( RecursiveCasterTest, test_dynamic_assign_policy )
{
    TestTypes types;
    Dictionary d = *makePoint( 1, 2 );
    d.insert( "z", 3 );
    d.insert( "w", 4 );

    std::vector<CastDiagnostic> diagnostics;
    RecursiveCaster caster( CastPolicy::DYNAMIC_ASSIGN, false,
                            [ &diagnostics ]( const CastDiagnostic & diag ) { diagnostics.push_back( diag ); } );

    auto p = caster.cast( d, types.point );
    ASSERT_TRUE( p -> allFieldsSet() );
    ASSERT_TRUE( types.point -> field( "z" ) == nullptr );

    ASSERT_EQ( diagnostics.size(), 2u );
    ASSERT_EQ( diagnostics[0].code, CastDiagnosticCode::DYNAMIC_ASSIGN_UNSUPPORTED );
    ASSERT_EQ( diagnostics[0].fieldName, "z" );
    ASSERT_EQ( diagnostics[0].sourceType, "Dictionary" );
    ASSERT_EQ( diagnostics[0].targetType, "Point" );
    ASSERT_EQ( diagnostics[1].fieldName, "w" );

    std::stringstream oss;
    oss << diagnostics[0];
    ASSERT_NE( oss.str().find( "DYNAMIC_ASSIGN_UNSUPPORTED" ), std::string::npos );
}

TEST( RecursiveCasterTest, test_static_fields_skipped )
{
    TestTypes types;
    Dictionary d;
    d.insert( "value", 10 );
    d.insert( "VERSION", 99 );

    auto v = recursiveCast( d, types.versioned );
    ASSERT_EQ( types.versioned -> field( "value" ) -> value<int32_t>( v.get() ), 10 );
    ASSERT_EQ( types.versioned -> staticFields().get<int32_t>( "VERSION" ), 3 );
}

TEST( RecursiveCasterTest, test_empty_field_name )
{
    TestTypes types;
    Dictionary d = *makePoint( 1, 2 );
    d.insert( "", 3 );

    ASSERT_THROW( recursiveCast( d, types.point ), MalformedSource );
    ASSERT_THROW( recursiveCast( d, types.point, false, CastPolicy::IGNORE ), MalformedSource );
}

TEST( RecursiveCasterTest, test_field_type_mismatch )
{
    TestTypes types;

    Dictionary d;
    d.insert( "x", "one" );
    ASSERT_THROW( recursiveCast( d, types.point ), FieldTypeMismatch );

    Dictionary line = makeLine();
    line.update( "start", 7 );
    ASSERT_THROW( recursiveCast( line, types.line ), FieldTypeMismatch );

    line = makeLine();
    line.update( "tags", "red" );
    ASSERT_THROW( recursiveCast( line, types.line ), FieldTypeMismatch );

    ASSERT_THROW( recursiveCast( line, types.line ), CastError );
}

TEST( RecursiveCasterTest, test_integer_ranges )
{
    TestTypes types;
    auto & meta = *types.small;

    Dictionary d;
    d.insert( "i8", -128 );
    d.insert( "u16", 65535u );
    d.insert( "i64", 7 );
    auto s = recursiveCast( d, types.small );
    ASSERT_EQ( meta.field( "i8" ) -> value<int8_t>( s.get() ), -128 );
    ASSERT_EQ( meta.field( "u16" ) -> value<uint16_t>( s.get() ), 65535 );
    ASSERT_EQ( meta.field( "i64" ) -> value<int64_t>( s.get() ), 7 );

    Dictionary tooBig;
    tooBig.insert( "i8", 300 );
    ASSERT_THROW( recursiveCast( tooBig, types.small ), FieldTypeMismatch );

    Dictionary negative;
    negative.insert( "u16", -1 );
    ASSERT_THROW( recursiveCast( negative, types.small ), FieldTypeMismatch );

    Dictionary huge;
    huge.insert( "i64", std::numeric_limits<uint64_t>::max() );
    ASSERT_THROW( recursiveCast( huge, types.small ), FieldTypeMismatch );
}

TEST( RecursiveCasterTest, test_none_values )
{
    TestTypes types;
    Dictionary d = makeLine();
    d.update( "name", std::monostate() );
    d.update( "end", std::monostate() );
    d.update( "extra", std::monostate() );

    auto line = recursiveCast( d, types.line );
    ASSERT_FALSE( types.line -> field( "name" ) -> isSet( line.get() ) );
    ASSERT_FALSE( types.line -> field( "end" ) -> isSet( line.get() ) );

    //generic fields hold the value as-is
    ASSERT_TRUE( types.line -> field( "extra" ) -> isSet( line.get() ) );
    ASSERT_TRUE( std::holds_alternative<std::monostate>( types.line -> field( "extra" ) -> value<GenericValue>( line.get() )._data ) );
}

TEST( RecursiveCasterTest, test_generic_field_does_not_share_source )
{
    auto holder = std::make_shared<StructMeta>( "Holder", StructMeta::Fields{
            makeStructField( RecastType::GENERIC(), "extra" ) } );

    auto inner = std::make_shared<Dictionary>();
    inner -> insert( "k", 1 );
    auto extra = std::make_shared<Dictionary>();
    extra -> insert( "inner", inner );
    extra -> insert( "k", 1 );

    Dictionary d;
    d.insert( "extra", extra );

    auto h = recursiveCast( d, holder );
    auto & held = std::get<DictionaryPtr>( holder -> field( "extra" ) -> value<GenericValue>( h.get() )._data );
    ASSERT_NE( held.get(), extra.get() );
    ASSERT_EQ( *held, *extra );

    held -> update( "k", 99 );
    held -> get<DictionaryPtr>( "inner" ) -> update( "k", 99 );
    ASSERT_EQ( extra -> get<int32_t>( "k" ), 1 );
    ASSERT_EQ( inner -> get<int32_t>( "k" ), 1 );

    //generic arrays are copied element-wise as well
    auto list = std::make_shared<StructMeta>( "HolderList", StructMeta::Fields{
            makeStructField( RecastArrayType::create( RecastType::GENERIC() ), "extras" ) } );
    Dictionary::Vector extras{ Dictionary::Data( extra ) };
    Dictionary ld;
    ld.insert( "extras", extras );

    auto l = recursiveCast( ld, list );
    auto & heldList = list -> field( "extras" ) -> value<std::vector<GenericValue>>( l.get() );
    std::get<DictionaryPtr>( heldList[0]._data ) -> update( "k", 42 );
    ASSERT_EQ( extra -> get<int32_t>( "k" ), 1 );
}

TEST( RecursiveCasterTest, test_cyclic_source )
{
    TestTypes types;
    auto d = std::make_shared<Dictionary>();
    d -> insert( "inner", d );

    ASSERT_THROW( recursiveCast( *d, types.wrapper ), CyclicGraph );

    //without the guard the self reference is cast as the declared nested type
    RecursiveCaster caster;
    caster.setDetectCycles( false );
    ASSERT_THROW( caster.cast( *d, types.wrapper ), UnknownFieldRejected );

    d -> update( "inner", std::monostate() );
}

TEST( RecursiveCasterTest, test_shared_subtree_is_not_cyclic )
{
    TestTypes types;
    auto shared = makePoint( 5, 6 );

    Dictionary d = makeLine();
    d.update( "start", shared );
    d.update( "end", shared );

    auto line = recursiveCast( d, types.line );
    auto & start = types.line -> field( "start" ) -> value<StructPtr>( line.get() );
    auto & end = types.line -> field( "end" ) -> value<StructPtr>( line.get() );
    ASSERT_NE( start.get(), end.get() );
    ASSERT_EQ( *structToDictionary( start.get() ), *structToDictionary( end.get() ) );
}

TEST( RecursiveCasterTest, test_constructor_path )
{
    auto meta = std::make_shared<StructMeta>( "Defaulted", StructMeta::Fields{
            makeStructField( RecastType::INT32(), "a" ),
            makeStructField( RecastType::INT32(), "b" ) } );

    auto def = meta -> createUninitialized();
    meta -> field( "b" ) -> setValue<int32_t>( def.get(), 42 );
    meta -> setDefault( def );

    Dictionary d;
    d.insert( "a", 1 );

    auto constructed = recursiveCast( d, meta, true );
    ASSERT_EQ( meta -> field( "a" ) -> value<int32_t>( constructed.get() ), 1 );
    ASSERT_TRUE( meta -> field( "b" ) -> isSet( constructed.get() ) );
    ASSERT_EQ( meta -> field( "b" ) -> value<int32_t>( constructed.get() ), 42 );

    auto bypassed = recursiveCast( d, meta, false );
    ASSERT_EQ( meta -> field( "a" ) -> value<int32_t>( bypassed.get() ), 1 );
    ASSERT_FALSE( meta -> field( "b" ) -> isSet( bypassed.get() ) );
}

TEST( RecursiveCasterTest, test_target_by_name )
{
    TestTypes types;
    RecursiveCaster caster;

    auto p = caster.cast( *makePoint( 1, 2 ), "Point", types.registry );
    ASSERT_EQ( p -> meta(), types.point.get() );

    ASSERT_THROW( caster.cast( *makePoint( 1, 2 ), "Missing", types.registry ), TargetTypeNotFound );

    auto meta = std::make_shared<StructMeta>( "RecursiveCasterTestGlobal", StructMeta::Fields{
            makeStructField( RecastType::INT32(), "x" ) } );
    StructMetaRegistry::instance().registerMeta( meta );

    Dictionary d;
    d.insert( "x", 1 );
    ASSERT_EQ( recursiveCast( d, "RecursiveCasterTestGlobal" ) -> meta(), meta.get() );
    ASSERT_THROW( recursiveCast( d, "RecursiveCasterTestNotRegistered" ), TargetTypeNotFound );
}

TEST( RecursiveCasterTest, test_properties )
{
    Dictionary props;
    props.insert( "policy", "IGNORE" );
    props.insert( "use_constructor", true );
    props.insert( "detect_cycles", false );

    RecursiveCaster caster( props );
    ASSERT_EQ( caster.policy(), CastPolicy::IGNORE );
    ASSERT_TRUE( caster.useConstructorPath() );
    ASSERT_FALSE( caster.detectCycles() );

    RecursiveCaster defaults( ( Dictionary() ) );
    ASSERT_EQ( defaults.policy(), CastPolicy::THROW );
    ASSERT_FALSE( defaults.useConstructorPath() );
    ASSERT_TRUE( defaults.detectCycles() );

    Dictionary bad;
    bad.insert( "policy", "SOMETIMES" );
    ASSERT_THROW( RecursiveCaster{ bad }, ValueError );

    Dictionary unknown;
    unknown.insert( "policy", "UNKNOWN" );
    ASSERT_THROW( RecursiveCaster{ unknown }, ValueError );

    Dictionary wrongType;
    wrongType.insert( "use_constructor", "yes" );
    ASSERT_THROW( RecursiveCaster{ wrongType }, TypeError );
}
