#include <gtest/gtest.h>
#include "location_format.hpp"

class LocationFormatTest : public ::testing::Test {
protected:
    void SetUp() override {
        facilities_.setEntry("AB12", "Test Pit", "Testvej 1, 8000 Aarhus C");
    }

    FacilityDirectory facilities_{defaultFacilities()};
};

TEST_F(LocationFormatTest, ParsesPlainCoordinates) {
    auto c = parseCoordinateLiteral("56.4167,10.7833");
    ASSERT_TRUE(c.has_value());
    EXPECT_DOUBLE_EQ(c->lat, 56.4167);
    EXPECT_DOUBLE_EQ(c->lon, 10.7833);

    auto spaced = parseCoordinateLiteral("  -33.9 ,  +151.2 ");
    ASSERT_TRUE(spaced.has_value());
    EXPECT_DOUBLE_EQ(spaced->lat, -33.9);
    EXPECT_DOUBLE_EQ(spaced->lon, 151.2);

    auto integers = parseCoordinateLiteral("56,10");
    ASSERT_TRUE(integers.has_value());
    EXPECT_DOUBLE_EQ(integers->lat, 56.0);
}

TEST_F(LocationFormatTest, ParsesHemisphereCoordinates) {
    auto north_east = parseCoordinateLiteral("55.676 N, 12.568 E");
    ASSERT_TRUE(north_east.has_value());
    EXPECT_DOUBLE_EQ(north_east->lat, 55.676);
    EXPECT_DOUBLE_EQ(north_east->lon, 12.568);

    auto south_west = parseCoordinateLiteral("33.9s, 70.6w");
    ASSERT_TRUE(south_west.has_value());
    EXPECT_DOUBLE_EQ(south_west->lat, -33.9);
    EXPECT_DOUBLE_EQ(south_west->lon, -70.6);
}

TEST_F(LocationFormatTest, NonCoordinateShapesReturnNothing) {
    EXPECT_FALSE(parseCoordinateLiteral("Rugvænget 18, 8444 Grenå").has_value());
    EXPECT_FALSE(parseCoordinateLiteral("1061").has_value());
    EXPECT_FALSE(parseCoordinateLiteral("56.4,10.7,3").has_value());
}

TEST_F(LocationFormatTest, OutOfRangeCoordinatesAreRejected) {
    EXPECT_THROW(parseCoordinateLiteral("95.0,10.0"), InvalidLocationError);
    EXPECT_THROW(parseCoordinateLiteral("45.0,181"), InvalidLocationError);
    EXPECT_THROW(parseCoordinateLiteral("91 N, 10 E"), InvalidLocationError);
    EXPECT_THROW(classifyLocation("95.0,10.0", facilities_), InvalidLocationError);
}

TEST_F(LocationFormatTest, EmptyTokenIsRejected) {
    EXPECT_THROW(classifyLocation("", facilities_), InvalidLocationError);
    EXPECT_THROW(classifyLocation("   \t", facilities_), InvalidLocationError);
}

TEST_F(LocationFormatTest, ClassifiesCoordinates) {
    EXPECT_EQ(classifyLocation("56.4167,10.7833", facilities_), LocationKind::Coordinate);
    EXPECT_EQ(classifyLocation("55.676 N, 12.568 E", facilities_), LocationKind::Coordinate);
}

TEST_F(LocationFormatTest, ClassifiesIdentifiers) {
    EXPECT_EQ(classifyLocation("1061", facilities_), LocationKind::Identifier);
    EXPECT_EQ(classifyLocation(" 1061 ", facilities_), LocationKind::Identifier);

    // All digits is always an identifier, known or not
    EXPECT_EQ(classifyLocation("99999", facilities_), LocationKind::Identifier);

    // Short alphanumeric only when the table knows it
    EXPECT_EQ(classifyLocation("AB12", facilities_), LocationKind::Identifier);
    EXPECT_EQ(classifyLocation("XY99", facilities_), LocationKind::Address);
}

TEST_F(LocationFormatTest, ClassifiesAddresses) {
    EXPECT_EQ(classifyLocation("Nørregade 10, 1000 København", facilities_), LocationKind::Address);
    EXPECT_EQ(classifyLocation("Hadstenvej 16, 8940 Randers SV", facilities_), LocationKind::Address);
}

TEST_F(LocationFormatTest, ResolveLocationFormatTrimsAndParses) {
    Location coordinate = resolveLocationFormat(" 56.4167,10.7833 ", facilities_);
    ASSERT_TRUE(std::holds_alternative<Coordinate>(coordinate));
    EXPECT_DOUBLE_EQ(std::get<Coordinate>(coordinate).lat, 56.4167);

    Location identifier = resolveLocationFormat(" 1061", facilities_);
    ASSERT_TRUE(std::holds_alternative<FacilityRef>(identifier));
    EXPECT_EQ(std::get<FacilityRef>(identifier).id, "1061");

    Location address = resolveLocationFormat("  Rugvænget 18, 8444 Grenå ", facilities_);
    ASSERT_TRUE(std::holds_alternative<AddressText>(address));
    EXPECT_EQ(std::get<AddressText>(address).text, "Rugvænget 18, 8444 Grenå");
    EXPECT_EQ(kindOf(address), LocationKind::Address);
}

TEST_F(LocationFormatTest, PlausibleAddress) {
    EXPECT_TRUE(isPlausibleAddress("Rugvænget 18, 8444 Grenå"));
    EXPECT_TRUE(isPlausibleAddress("Vej 1"));
    EXPECT_FALSE(isPlausibleAddress("Vej"));
    EXPECT_FALSE(isPlausibleAddress("Main Street"));
    EXPECT_FALSE(isPlausibleAddress("12345678"));
    EXPECT_FALSE(isPlausibleAddress(std::string(201, 'a') + "1"));
}

TEST_F(LocationFormatTest, KindNames) {
    EXPECT_STREQ(locationKindName(LocationKind::Coordinate), "coordinate");
    EXPECT_STREQ(locationKindName(LocationKind::Identifier), "identifier");
    EXPECT_STREQ(locationKindName(LocationKind::Address), "address");
}
