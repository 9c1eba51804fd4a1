/*
 * Copyright (C) 2025 Emeric Poupon
 *
 * This file is part of Liner.
 *
 * Liner is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Liner is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Liner.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <memory>
#include <sstream>

#include <gtest/gtest.h>

#include "core/ILogger.hpp"
#include "core/Service.hpp"
#include "core/StreamLogger.hpp"

namespace liner::core::tests
{
    namespace
    {
        class IRuleProvider
        {
        public:
            virtual ~IRuleProvider() = default;
            virtual int getRuleCount() const = 0;
        };

        class RuleProvider : public IRuleProvider
        {
        public:
            int getRuleCount() const override { return 3; }
        };
    } // namespace

    TEST(Service, lifetime)
    {
        EXPECT_FALSE(Service<IRuleProvider>::exists());
        EXPECT_EQ(Service<IRuleProvider>::get(), nullptr);

        {
            Service<IRuleProvider> provider{ std::make_unique<RuleProvider>() };

            EXPECT_TRUE(Service<IRuleProvider>::exists());
            EXPECT_EQ(Service<IRuleProvider>::get(), provider.operator->());
            EXPECT_EQ(provider->getRuleCount(), 3);
            EXPECT_EQ((*provider).getRuleCount(), 3);
        }

        EXPECT_FALSE(Service<IRuleProvider>::exists());
    }

    TEST(Service, independentInterfaces)
    {
        std::ostringstream oss;
        Service<IRuleProvider> provider{ std::make_unique<RuleProvider>() };
        Service<logging::ILogger> logger{ std::make_unique<logging::StreamLogger>(oss) };

        EXPECT_TRUE(Service<IRuleProvider>::exists());
        EXPECT_TRUE(Service<logging::ILogger>::exists());
        EXPECT_NE(static_cast<void*>(Service<IRuleProvider>::get()), static_cast<void*>(Service<logging::ILogger>::get()));
    }
} // namespace liner::core::tests
