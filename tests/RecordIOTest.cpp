#include "io/CsvIO.hpp"
#include "io/JsonIO.hpp"
#include "io/RecordIO.hpp"
#include "org/Registry.hpp"
#include "payroll/Errors.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using payroll::InputError;

namespace {

class TempDir : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_dir = fs::temp_directory_path() / (std::string("staff_pay_") + info->test_suite_name() + "_" + info->name());
        fs::remove_all(m_dir);
        fs::create_directories(m_dir);
    }
    void TearDown() override { fs::remove_all(m_dir); }

    std::string path(const std::string& file) const { return (m_dir / file).string(); }

    static std::string read_all(const std::string& p) {
        std::ifstream in(p);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path m_dir;
};

io::EmployeeRecord record(const std::string& name, const std::string& dept, double base) {
    io::EmployeeRecord r;
    r.name = name;
    r.position = "Clerk";
    r.department = dept;
    r.base_salary = base;
    return r;
}

using RecordFilesTest = TempDir;

}  // namespace

TEST(JsonIOTest, ToleratesMissingProductionAndNumericStrings) {
    std::istringstream in(R"([
        {"name": "Ann", "position": "Clerk", "department": "Sales", "base_salary": "2000.5"},
        {"name": "Bob", "position": "Clerk", "department": "Ops", "base_salary": 10,
         "production": {"2024-05": 3, "2024-06": "4.5"}, "bonus": "25"}
    ])");

    const auto records = io::load_json_records(in);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].base_salary, 2000.5);
    EXPECT_TRUE(records[0].production.empty());
    EXPECT_TRUE(records[0].payment_scheme.empty());
    EXPECT_EQ(records[1].production.at("2024-05"), 3.0);
    EXPECT_EQ(records[1].production.at("2024-06"), 4.5);
    EXPECT_EQ(records[1].bonus, 25.0);
}

TEST(JsonIOTest, RejectsMalformedRecords) {
    {
        std::istringstream in(R"([{"name": "Ann", "position": "Clerk", "base_salary": 1}])");
        EXPECT_THROW(io::load_json_records(in), InputError);
    }
    {
        std::istringstream in(R"([{"name": "Ann", "position": "Clerk", "department": "S", "base_salary": "lots"}])");
        EXPECT_THROW(io::load_json_records(in), InputError);
    }
    {
        std::istringstream in(R"({"name": "Ann"})");
        EXPECT_THROW(io::load_json_records(in), InputError);
    }
    {
        std::istringstream in("[{");
        EXPECT_THROW(io::load_json_records(in), InputError);
    }
}

TEST(JsonIOTest, NumberOverflowIsMalformedInput) {
    std::istringstream in(R"([{"name": "Ann", "position": "Clerk", "department": "Sales", "base_salary": 1e400}])");
    EXPECT_THROW(io::load_json_records(in), InputError);
}

TEST(CsvIOTest, NumbersSurviveRoundTripExactly) {
    io::EmployeeRecord r = record("Ann", "Sales", 0.1 + 0.2);
    r.bonus = 1.0 / 3.0;

    std::stringstream buf;
    io::write_csv_records(buf, {r});
    const auto back = io::load_csv_records(buf);

    ASSERT_EQ(back.size(), 1u);
    EXPECT_EQ(back[0].base_salary, 0.1 + 0.2);
    EXPECT_EQ(back[0].bonus, 1.0 / 3.0);
}

TEST(CsvIOTest, LoadsRowsWithQuotingAndBlankLines) {
    std::istringstream in(
        "name,position,department,base_salary\r\n"
        "Ann,Clerk,Sales,2000\r\n"
        "\r\n"
        "\"Smith, Bob\",\"Senior \"\"Lead\"\"\",Ops, 1500.25 \n");

    const auto records = io::load_csv_records(in);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].name, "Ann");
    EXPECT_EQ(records[0].department, "Sales");
    EXPECT_EQ(records[0].base_salary, 2000.0);
    EXPECT_EQ(records[1].name, "Smith, Bob");
    EXPECT_EQ(records[1].position, "Senior \"Lead\"");
    EXPECT_EQ(records[1].base_salary, 1500.25);
    EXPECT_TRUE(records[1].production.empty());
}

TEST(CsvIOTest, RejectsMissingColumnsAndBadNumbers) {
    {
        std::istringstream in("name,position,base_salary\nAnn,Clerk,10\n");
        EXPECT_THROW(io::load_csv_records(in), InputError);
    }
    {
        std::istringstream in("name,position,department,base_salary\nAnn,Clerk,Sales,ten\n");
        EXPECT_THROW(io::load_csv_records(in), InputError);
    }
    {
        std::istringstream in("name,position,department,base_salary\nAnn,Clerk\n");
        EXPECT_THROW(io::load_csv_records(in), InputError);
    }
    {
        std::istringstream in("");
        EXPECT_THROW(io::load_csv_records(in), InputError);
    }
}

TEST(CsvIOTest, WriterQuotesAndRequiresRecords) {
    std::ostringstream out;
    EXPECT_THROW(io::write_csv_records(out, {}), InputError);

    io::EmployeeRecord r = record("Smith, Bob", "Ops", 1500.0);
    r.bonus_scheme = "fixed";
    r.bonus = 20.0;
    io::write_csv_records(out, {r});

    EXPECT_EQ(out.str(),
              "name,position,department,base_salary,bonus,payment_scheme,bonus_scheme,role\n"
              "\"Smith, Bob\",Clerk,Ops,1500,20,,fixed,\n");
}

TEST_F(RecordFilesTest, JsonRoundTripThroughRegistry) {
    org::Registry reg;
    reg.create_department("Sales");
    org::EmployeeDraft d;
    d.name = "Ann";
    d.position = "Seller";
    d.base_salary = 2000.0;
    d.payment_scheme = payroll::PercentPlanWithBonus{};
    d.bonus_scheme = payroll::FixedBonus{300.0};
    reg.add_employee("Sales", d).set_production("2024-05", 42.5);

    const std::string p = path("staff.json");
    io::save_records(p, reg.export_records());

    const std::string text = read_all(p);
    EXPECT_NE(text.find("[\n    {\n        \""), std::string::npos);

    org::Registry loaded;
    loaded.import_records(io::load_records(p));
    const org::Employee* ann = loaded.find_employee("Ann");
    ASSERT_NE(ann, nullptr);
    EXPECT_EQ(ann->position(), "Seller");
    EXPECT_EQ(ann->department().name(), "Sales");
    EXPECT_EQ(ann->base_salary(), 2000.0);
    EXPECT_EQ(ann->production(), reg.find_employee("Ann")->production());
    EXPECT_TRUE(std::holds_alternative<payroll::PercentPlanWithBonus>(ann->payment_scheme()));
    EXPECT_DOUBLE_EQ(payroll::fixed_bonus_amount(ann->bonus_scheme()), 300.0);
}

TEST_F(RecordFilesTest, InvalidUtf8NameDoesNotWipeExistingFile) {
    const std::string p = path("staff.json");
    io::save_json_records(p, {record("Ann", "Sales", 100.0)});
    ASSERT_GT(fs::file_size(p), 0u);

    // cp1251 bytes, not valid UTF-8
    EXPECT_NO_THROW(io::save_json_records(p, {record("\xC8\xE2", "Sales", 200.0)}));

    const auto back = io::load_json_records(p);
    ASSERT_EQ(back.size(), 1u);
    EXPECT_FALSE(back[0].name.empty());
    EXPECT_NE(back[0].name.find("\xEF\xBF\xBD"), std::string::npos);
    EXPECT_EQ(back[0].department, "Sales");
    EXPECT_EQ(back[0].base_salary, 200.0);
}

TEST_F(RecordFilesTest, UntaggedJsonReloadsAsFixedSalary) {
    const std::string p = path("legacy.json");
    {
        std::ofstream out(p);
        out << R"([{"name": "Ann", "position": "Clerk", "department": "Sales", "base_salary": 2000,
                   "production": {"2024-05": 10}}])";
    }

    org::Registry reg;
    reg.import_records(io::load_records(p));
    const org::Employee* ann = reg.find_employee("Ann");
    ASSERT_NE(ann, nullptr);
    EXPECT_TRUE(std::holds_alternative<payroll::FixedSalaryWithBonus>(ann->payment_scheme()));
    EXPECT_TRUE(std::holds_alternative<payroll::FixedBonus>(ann->bonus_scheme()));
    EXPECT_DOUBLE_EQ(ann->calculate_salary("2024-05"), 2000.0);
}

TEST_F(RecordFilesTest, CsvRoundTripDropsProduction) {
    io::EmployeeRecord r = record("Ann", "Sales", 1234.5);
    r.production["2024-05"] = 9.0;
    const std::string p = path("staff.CSV");
    io::save_records(p, {r, record("Bob", "Ops", 10.0)});

    const auto back = io::load_records(p);
    ASSERT_EQ(back.size(), 2u);
    EXPECT_EQ(back[0].name, "Ann");
    EXPECT_EQ(back[0].base_salary, 1234.5);
    EXPECT_TRUE(back[0].production.empty());
    EXPECT_EQ(back[1].department, "Ops");
}

TEST_F(RecordFilesTest, DispatchRejectsUnknownExtensionsAndMissingFiles) {
    EXPECT_THROW(io::format_for_path(path("staff.xml")), InputError);
    EXPECT_THROW(io::save_records(path("staff.txt"), {record("Ann", "Sales", 1.0)}), InputError);
    EXPECT_THROW(io::load_records(path("missing.json")), std::runtime_error);
    EXPECT_THROW(io::save_records(path("empty.csv"), {}), InputError);
    EXPECT_FALSE(fs::exists(path("empty.csv")));
}
