#include "test_chunked.hpp"
#include "test_directory_traversal.hpp"
#include "test_enum_string_convert.hpp"
#include "test_format_bytes.hpp"
#include "test_temporary_directory.hpp"

#include <gtest/gtest.h>

#include <filesystem>

std::filesystem::path programDirectory;

int main(int argc, char** argv)
{
    programDirectory = std::filesystem::path{argv[0]}.parent_path();

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
