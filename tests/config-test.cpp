// Tests for configuration validation.

#include <recsim/Config.hpp>
#include <recsim/Simulation.hpp>
#include <recsim/Experiment.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace recsim;

TEST(Config, Defaults) {
    Config c;
    EXPECT_NO_THROW(c.validate());
    EXPECT_EQ(20, c.matrix_size);
    EXPECT_EQ(10, c.ticks);
    EXPECT_EQ(10, c.experiments);
    EXPECT_DOUBLE_EQ(1, c.search_price);
    EXPECT_DOUBLE_EQ(5, c.consume_price);
    EXPECT_DOUBLE_EQ(10, c.starting_budget);
    EXPECT_DOUBLE_EQ(0.8, c.well_served_threshold);
    EXPECT_DOUBLE_EQ(0.95, c.optimal_ratio_cutoff);
    EXPECT_EQ(10, c.top_n);
    EXPECT_DOUBLE_EQ(4, c.utility.mean);
    EXPECT_DOUBLE_EQ(2, c.utility.sd);
    EXPECT_EQ(0, c.rating_scale);
    EXPECT_EQ(0, c.neighbourhood);
    // Newcomers fall back to the whole population unless told otherwise
    EXPECT_TRUE(c.cold_start_fallback);
}

TEST(Config, Sizes) {
    Config c;
    c.matrix_size = 0;
    EXPECT_THROW(c.validate(), ConfigurationError);

    c = Config();
    c.ticks = 0;
    EXPECT_THROW(c.validate(), ConfigurationError);

    c = Config();
    c.experiments = 0;
    EXPECT_THROW(c.validate(), ConfigurationError);

    c = Config();
    c.new_users = 0;
    EXPECT_THROW(c.validate(), ConfigurationError);

    c = Config();
    c.top_n = 21;
    EXPECT_THROW(c.validate(), ConfigurationError);
    c.top_n = 20;
    EXPECT_NO_THROW(c.validate());
    c.top_n = 0;
    EXPECT_THROW(c.validate(), ConfigurationError);

    c = Config();
    c.initial_reviews = 21;
    EXPECT_THROW(c.validate(), ConfigurationError);
    c.initial_reviews = 0;
    EXPECT_NO_THROW(c.validate());
}

TEST(Config, Prices) {
    Config c;
    c.search_price = 0;
    EXPECT_THROW(c.validate(), ConfigurationError);
    c.search_price = -1;
    EXPECT_THROW(c.validate(), ConfigurationError);
    c.search_price = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(c.validate(), ConfigurationError);
    c.search_price = std::numeric_limits<double>::infinity();
    EXPECT_THROW(c.validate(), ConfigurationError);

    c = Config();
    c.consume_price = 0;
    EXPECT_THROW(c.validate(), ConfigurationError);

    c = Config();
    c.starting_budget = -10;
    EXPECT_THROW(c.validate(), ConfigurationError);
}

TEST(Config, Fractions) {
    Config c;
    c.well_served_threshold = 1.5;
    EXPECT_THROW(c.validate(), ConfigurationError);
    c.well_served_threshold = 1;
    EXPECT_NO_THROW(c.validate());
    c.well_served_threshold = 0;
    EXPECT_NO_THROW(c.validate());

    c.optimal_ratio_cutoff = -0.01;
    EXPECT_THROW(c.validate(), ConfigurationError);
    c.optimal_ratio_cutoff = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(c.validate(), ConfigurationError);
}

TEST(Config, Scales) {
    Config c;
    c.rating_scale = 1;
    EXPECT_THROW(c.validate(), ConfigurationError);
    c.rating_scale = 2;
    EXPECT_NO_THROW(c.validate());
    c.rating_scale = 10;
    EXPECT_NO_THROW(c.validate());

    c.utility.sd = 0;
    EXPECT_THROW(c.validate(), ConfigurationError);
    c.rating_scale = 0;
    EXPECT_NO_THROW(c.validate());

    c.utility.noise_sd = -1;
    EXPECT_THROW(c.validate(), ConfigurationError);

    c = Config();
    c.review_noise_sd = -0.5;
    EXPECT_THROW(c.validate(), ConfigurationError);
}

TEST(Config, ErrorType) {
    Config c;
    c.matrix_size = 0;
    try {
        c.validate();
        FAIL() << "validate() should have thrown";
    }
    catch (const std::domain_error &e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("matrix_size"));
    }
}

TEST(Config, CheckedBeforeWork) {
    Config c;
    c.top_n = 50;
    EXPECT_THROW(Simulation(c, 1), ConfigurationError);
    EXPECT_THROW(Experiment{c}, ConfigurationError);

    c = Config();
    c.rating_scale = 1;
    EXPECT_THROW(Simulation(c, 1), ConfigurationError);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
