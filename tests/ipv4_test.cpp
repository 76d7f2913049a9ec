#define BOOST_TEST_MODULE Ipv4Test
#include <boost/test/unit_test.hpp>

#include <meridian/topology/ipv4.hpp>

using namespace meridian::topology;

namespace {
    constexpr const char* host_address = "10.0.12.1";
    constexpr const char* slash30_mask = "255.255.255.252";
    constexpr std::uint8_t slash30 = 30;
}

BOOST_AUTO_TEST_SUITE(address_parsing)

BOOST_AUTO_TEST_CASE(parses_dotted_quad) {
    auto address = parse_ipv4(host_address);

    BOOST_REQUIRE(address.has_value());
    BOOST_CHECK_EQUAL(address->value(), 0x0A000C01u);
    BOOST_CHECK_EQUAL(address->to_string(), host_address);
}

BOOST_AUTO_TEST_CASE(rejects_malformed_addresses) {
    BOOST_CHECK(!parse_ipv4("").has_value());
    BOOST_CHECK(!parse_ipv4("10.0.12").has_value());
    BOOST_CHECK(!parse_ipv4("10.0.12.256").has_value());
    BOOST_CHECK(!parse_ipv4("not-an-ip").has_value());
}

BOOST_AUTO_TEST_CASE(addresses_order_numerically) {
    BOOST_CHECK(*parse_ipv4("10.0.0.9") < *parse_ipv4("10.0.0.10"));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(mask_parsing)

BOOST_AUTO_TEST_CASE(accepts_dotted_and_prefix_forms) {
    BOOST_CHECK_EQUAL(*parse_subnet_mask(slash30_mask), slash30);
    BOOST_CHECK_EQUAL(*parse_subnet_mask("/30"), slash30);
    BOOST_CHECK_EQUAL(*parse_subnet_mask("30"), slash30);
    BOOST_CHECK_EQUAL(*parse_subnet_mask("0.0.0.0"), 0);
    BOOST_CHECK_EQUAL(*parse_subnet_mask("255.255.255.255"), 32);
}

BOOST_AUTO_TEST_CASE(rejects_non_contiguous_and_out_of_range_masks) {
    BOOST_CHECK(!parse_subnet_mask("255.0.255.0").has_value());
    BOOST_CHECK(!parse_subnet_mask("/33").has_value());
    BOOST_CHECK(!parse_subnet_mask("").has_value());
    BOOST_CHECK(!parse_subnet_mask("thirty").has_value());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(subnet_keys)

BOOST_AUTO_TEST_CASE(both_ends_of_a_slash30_share_a_key) {
    auto a = SubnetKey::of(*parse_ipv4("10.0.12.1"), slash30);
    auto b = SubnetKey::of(*parse_ipv4("10.0.12.2"), slash30);
    auto other = SubnetKey::of(*parse_ipv4("10.0.12.5"), slash30);

    BOOST_CHECK(a == b);
    BOOST_CHECK(a != other);
    BOOST_CHECK_EQUAL(a.to_string(), "10.0.12.0/30");
    BOOST_CHECK(a.contains(*parse_ipv4("10.0.12.3")));
    BOOST_CHECK(!a.contains(*parse_ipv4("10.0.12.4")));
}

BOOST_AUTO_TEST_CASE(same_network_with_different_prefix_is_a_different_key) {
    auto narrow = SubnetKey::of(*parse_ipv4("10.0.0.1"), 30);
    auto wide = SubnetKey::of(*parse_ipv4("10.0.0.1"), 24);

    BOOST_CHECK(narrow != wide);
}

BOOST_AUTO_TEST_CASE(parses_its_own_text_form) {
    auto key = parse_subnet_key("192.168.0.0/24");

    BOOST_REQUIRE(key.has_value());
    BOOST_CHECK_EQUAL(key->prefix_length(), 24);
    BOOST_CHECK_EQUAL(key->mask().to_string(), "255.255.255.0");
    BOOST_CHECK(!parse_subnet_key("192.168.0.1/24").has_value());
    BOOST_CHECK(!parse_subnet_key("192.168.0.0").has_value());
}

BOOST_AUTO_TEST_SUITE_END()
