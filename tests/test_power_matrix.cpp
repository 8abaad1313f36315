/*
 * PowerMatrix tests: construction, symmetric writes,
 * row/column append and removal with bounds checking.
 */

#include <catch2/catch.hpp>
#include "power_matrix.hpp"
#include "errors.hpp"
#include <vector>

TEST_CASE("PowerMatrix construction", "[matrix][lifecycle]") {
    SECTION("Zero filled square matrix") {
        PowerMatrix m(3);
        REQUIRE(m.size() == 3);
        for (int i = 0; i < 3; ++i)
            for (int j = 0; j < 3; ++j)
                REQUIRE(m(i, j) == 0.0);
    }

    SECTION("Empty matrix") {
        PowerMatrix m;
        REQUIRE(m.size() == 0);
        REQUIRE(m.isSymmetric());
        REQUIRE(m.hasZeroDiagonal());
    }

    SECTION("Negative dimension is rejected") {
        REQUIRE_THROWS_AS(PowerMatrix(-1), InvalidConfiguration);
    }

    SECTION("Non-square rows are rejected") {
        std::vector<std::vector<double>> rows = { { 0.0, 1.0 }, { 1.0 } };
        REQUIRE_THROWS_AS(PowerMatrix(rows), InvalidConfiguration);
    }

    SECTION("Rows are kept as given") {
        PowerMatrix m(std::vector<std::vector<double>>{ { 0.0, 2.0 }, { 3.0, 0.0 } });
        REQUIRE(m.size() == 2);
        REQUIRE(m(0, 1) == 2.0);
        REQUIRE(m(1, 0) == 3.0);
        REQUIRE_FALSE(m.isSymmetric());
    }
}

TEST_CASE("PowerMatrix element access", "[matrix][access]") {
    PowerMatrix m(3);
    m.setSymmetric(0, 2, 7.5);

    REQUIRE(m.at(0, 2) == 7.5);
    REQUIRE(m.at(2, 0) == 7.5);
    REQUIRE(m.row(2)[0] == 7.5);
    REQUIRE(m.isSymmetric());
    REQUIRE(m.hasZeroDiagonal());

    SECTION("Checked access rejects bad indices") {
        REQUIRE_THROWS_AS(m.at(3, 0), IndexOutOfRange);
        REQUIRE_THROWS_AS(m.at(0, -1), IndexOutOfRange);
        REQUIRE_THROWS_AS(m.row(5), IndexOutOfRange);
        REQUIRE_THROWS_AS(m.setSymmetric(0, 3, 1.0), IndexOutOfRange);
    }

    SECTION("Diagonal cannot be written") {
        REQUIRE_THROWS_AS(m.setSymmetric(1, 1, 4.0), InvalidConfiguration);
        REQUIRE(m(1, 1) == 0.0);
    }
}

TEST_CASE("PowerMatrix append row and column", "[matrix][append]") {
    PowerMatrix m(2);
    m.setSymmetric(0, 1, 1.5);

    m.appendRowColumn({ 2.0, 3.0 });

    REQUIRE(m.size() == 3);
    REQUIRE(m(0, 2) == 2.0);
    REQUIRE(m(2, 0) == 2.0);
    REQUIRE(m(1, 2) == 3.0);
    REQUIRE(m(2, 1) == 3.0);
    REQUIRE(m(2, 2) == 0.0);
    REQUIRE(m(0, 1) == 1.5);
    REQUIRE(m.isSymmetric());
    REQUIRE(m.hasZeroDiagonal());

    SECTION("Wrong coefficient count leaves matrix unchanged") {
        PowerMatrix copy = m;
        REQUIRE_THROWS_AS(m.appendRowColumn({ 1.0 }), InvalidConfiguration);
        REQUIRE(m == copy);
    }

    SECTION("Append to empty matrix") {
        PowerMatrix e;
        e.appendRowColumn({});
        REQUIRE(e.size() == 1);
        REQUIRE(e(0, 0) == 0.0);
    }
}

TEST_CASE("PowerMatrix remove row and column", "[matrix][remove]") {
    PowerMatrix m(std::vector<std::vector<double>>{
        { 0.0, 1.0, 2.0, 3.0 },
        { 1.0, 0.0, 4.0, 5.0 },
        { 2.0, 4.0, 0.0, 6.0 },
        { 3.0, 5.0, 6.0, 0.0 } });

    SECTION("Remove middle index") {
        m.removeRowColumn(1);
        REQUIRE(m.size() == 3);
        REQUIRE(m(0, 1) == 2.0);
        REQUIRE(m(0, 2) == 3.0);
        REQUIRE(m(1, 2) == 6.0);
        REQUIRE(m.isSymmetric());
        REQUIRE(m.hasZeroDiagonal());
    }

    SECTION("Remove last index") {
        m.removeRowColumn(3);
        REQUIRE(m.size() == 3);
        REQUIRE(m(1, 2) == 4.0);
    }

    SECTION("Out of range index leaves matrix unchanged") {
        PowerMatrix copy = m;
        REQUIRE_THROWS_AS(m.removeRowColumn(4), IndexOutOfRange);
        REQUIRE_THROWS_AS(m.removeRowColumn(-1), IndexOutOfRange);
        REQUIRE(m == copy);
    }
}
