#include <catch2/catch.hpp>

#include "SBE/Mesh/KPath.hpp"
#include "SBE/Errors.hpp"

using namespace SBE;

TEST_CASE("Two line mesh", "[mesh]") {
    const h_float a = 8.308;
    const h_float length = 5. * pi / a;
    const int Nk = 400;

    SECTION("geometry along k_x") {
        const Mesh::KMesh mesh = Mesh::two_line_mesh(Nk, 0.05, length, a, 0.);
        REQUIRE(mesh.n_paths() == 2);
        CHECK(mesh.points_per_path() == Nk);
        CHECK(mesh.E_dir(0) == Approx(1.));
        CHECK(mesh.E_dir(1) == Approx(0.).margin(1e-15));

        const h_float offset = 2. * (pi / a) * 0.05;
        for (const auto& path : mesh.paths) {
            CHECK(path.dk == Approx(length / Nk));
            CHECK(std::abs(path.points.front().y) == Approx(offset));
            // symmetric around the foot of the perpendicular
            CHECK(path.points.front().x == Approx(-path.points.back().x));
            for (int i = 1; i < path.size(); ++i) {
                CHECK(path.points[i].x - path.points[i - 1].x == Approx(path.dk));
                CHECK(path.points[i].y == Approx(path.points[0].y));
            }
        }
        CHECK(mesh.paths[0].points[0].y == Approx(-mesh.paths[1].points[0].y));
    }

    SECTION("rotated field") {
        const Mesh::KMesh mesh = Mesh::two_line_mesh(10, 0.05, length, a, 90.);
        CHECK(mesh.E_dir(1) == Approx(1.));
        const auto& path = mesh.paths.front();
        CHECK(path.points[1].y - path.points[0].y == Approx(path.dk));
        CHECK(path.points[1].x == Approx(path.points[0].x));
        CHECK(mesh.E_ort()(0) == Approx(1.));
    }

    SECTION("shifted coordinates") {
        const Mesh::KMesh mesh = Mesh::two_line_mesh(10, 0.05, length, a, 30.);
        const auto& path = mesh.paths.front();
        const nd_vector kx = path.kx(0.1, mesh.E_dir);
        const nd_vector ky = path.ky(0.1, mesh.E_dir);
        for (int i = 0; i < path.size(); ++i) {
            CHECK(kx(i) == Approx(path.points[i].x + 0.1 * mesh.E_dir(0)));
            CHECK(ky(i) == Approx(path.points[i].y + 0.1 * mesh.E_dir(1)));
        }
    }

    SECTION("single point") {
        const Mesh::KMesh mesh = Mesh::two_line_mesh(1, 0.05, length, a, 0.);
        CHECK(mesh.points_per_path() == 1);
        CHECK(mesh.paths.front().points.front().x == Approx(0.).margin(1e-15));
    }

    SECTION("empty path") {
        CHECK_THROWS_AS(Mesh::two_line_mesh(0, 0.05, length, a, 0.), ConfigurationError);
    }
}

TEST_CASE("Hexagonal mesh", "[mesh]") {
    const h_float a = 8.308;
    // distance Gamma - K, the largest distance inside the hexagonal zone
    const h_float k_max = 4. * pi / (3. * a);

    SECTION("M alignment stays in the first zone") {
        const Mesh::KMesh mesh = Mesh::hexagonal_mesh(12, 8, a, Mesh::Alignment::M);
        REQUIRE(mesh.n_paths() == 8);
        CHECK(mesh.points_per_path() == 12);
        CHECK(mesh.E_dir(0) == Approx(std::cos(pi / 6.)));
        CHECK(mesh.E_dir(1) == Approx(-0.5));
        for (const auto& path : mesh.paths) {
            CHECK(path.dk == Approx(4. * pi / (sqrt_3 * a) / 12.));
            for (const auto& k : path.points) {
                CHECK(norm(k.x, k.y) <= k_max * (1. + 1e-9));
            }
        }
    }

    SECTION("K alignment") {
        const Mesh::KMesh mesh = Mesh::hexagonal_mesh(20, 5, a, Mesh::Alignment::K);
        REQUIRE(mesh.n_paths() == 5);
        CHECK(mesh.points_per_path() == 20);
        CHECK(mesh.E_dir(0) == 1.);
        CHECK(mesh.E_dir(1) == 0.);
        for (const auto& path : mesh.paths) {
            CHECK(path.dk == Approx(4. * pi / (a * 20.)));
        }
        // the first path runs through Gamma along k_x
        for (const auto& k : mesh.paths.front().points) {
            CHECK(std::abs(k.y) <= 2. * pi / (sqrt_3 * a) * (1. + 1e-12));
        }
    }

    SECTION("alignment parsing") {
        CHECK(Mesh::alignment_from_string("K") == Mesh::Alignment::K);
        CHECK(Mesh::alignment_from_string("M") == Mesh::Alignment::M);
        CHECK_THROWS_AS(Mesh::alignment_from_string("X"), ConfigurationError);
    }

    SECTION("invalid counts") {
        CHECK_THROWS_AS(Mesh::hexagonal_mesh(0, 4, a, Mesh::Alignment::M), ConfigurationError);
        CHECK_THROWS_AS(Mesh::hexagonal_mesh(4, 0, a, Mesh::Alignment::K), ConfigurationError);
    }
}
