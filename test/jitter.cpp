#include <cmath>
#include <vector>

#include "../include/Oneiro.h"
#include "support.hpp"

int main() {
    Oneiro::Test::Suite suite("jitter");
    torch::manual_seed(11);

    {
        const auto tensor = torch::randn({1, 3, 16, 20});
        const Oneiro::Regularization::ShiftOffset offset{3, 5};
        const auto shifted = Oneiro::Regularization::Shift(tensor, offset);
        suite.expect(shifted.sizes().equals(tensor.sizes()), "shift preserves the shape");
        suite.expect(torch::equal(shifted[0][1][3][5], tensor[0][1][0][0]), "origin moves by (3, 5)");
        suite.expect(torch::equal(shifted[0][2][0][0], tensor[0][2][13][15]), "trailing pixels wrap to the front");

        const auto restored = Oneiro::Regularization::Shift(shifted, offset, /*undo=*/true);
        suite.expect(torch::equal(restored.detach(), tensor), "undo restores the input exactly");

        suite.expect(std::abs(shifted.sum().item<double>() - tensor.sum().item<double>()) < 1e-3, "roll keeps every value");
    }

    {
        const auto tensor = torch::randn({1, 3, 7, 9});
        const auto shifted = Oneiro::Regularization::Shift(tensor, 37, -101);
        const auto reduced = Oneiro::Regularization::Shift(tensor, 37 % 7, -101 % 9);
        suite.expect(torch::equal(shifted.detach(), reduced.detach()), "offsets beyond the extent wrap around");
        const auto restored = Oneiro::Regularization::Shift(shifted, 37, -101, true);
        suite.expect(torch::equal(restored.detach(), tensor), "large offsets undo exactly");
    }

    {
        const auto tensor = torch::randn({1, 3, 5, 5});
        const auto same = Oneiro::Regularization::Shift(tensor, 0, 0);
        suite.expect(torch::equal(same.detach(), tensor), "zero offset is the identity");
        suite.expect(Oneiro::Regularization::ShiftOffset{2, -4}.inverse().horizontal == 4, "inverse negates the offset");
    }

    {
        const auto plain = torch::randn({1, 3, 6, 6});
        const auto shifted = Oneiro::Regularization::Shift(plain, 1, 2);
        suite.expect(shifted.requires_grad() && shifted.is_leaf(), "shifted tensor is a differentiable leaf");

        const auto loss = (shifted * 2.0).sum();
        loss.backward();
        suite.expect(shifted.grad().defined(), "gradient flows into the shifted tensor");
        suite.expect_close(shifted.grad(), torch::full_like(shifted, 2.0), 1e-6, "gradient of the following op");
    }

    {
        auto tracked = torch::randn({1, 3, 6, 6}).requires_grad_(true);
        const auto shifted = Oneiro::Regularization::Shift(tracked * 3.0, 1, 1);
        suite.expect(shifted.is_leaf(), "shift detaches from upstream history");
    }

    {
        const auto planes = torch::randn({3, 6, 8});
        const auto shifted = Oneiro::Regularization::Shift(planes, 2, 3);
        suite.expect(torch::equal(shifted[1][2][3], planes[1][0][0]), "unbatched tensor rolls its trailing axes");
        suite.expect(torch::equal(Oneiro::Regularization::Shift(shifted, 2, 3, true).detach(), planes), "unbatched undo");
    }

    suite.expect_throws<Oneiro::Error::InvalidShape>([] {
        static_cast<void>(Oneiro::Regularization::Shift(torch::zeros({8, 8}), 1, 1));
    }, "two-dimensional tensor is rejected");
    suite.expect_throws<Oneiro::Error::InvalidShape>([] {
        static_cast<void>(Oneiro::Regularization::Shift(torch::zeros({1, 3, 8, 8}, torch::kInt64), 1, 1));
    }, "integer tensor is rejected");

    return suite.finish();
}
