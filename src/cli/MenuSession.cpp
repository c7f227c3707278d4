#include "cli/MenuSession.hpp"

#include "io/CsvIO.hpp"
#include "io/JsonIO.hpp"
#include "util/TextUtil.hpp"

#include <iomanip>
#include <stdexcept>
#include <string>
#include <utility>

namespace cli {

namespace {

// thrown when input ends in the middle of an action
struct EndOfInput {};

class MenuSession {
public:
    MenuSession(org::Registry& registry, std::istream& in, std::ostream& out, const MenuConfig& cfg)
        : m_registry(registry), m_in(in), m_out(out), m_cfg(cfg) {}

    int run();

private:
    void print_menu();
    std::string ask(const std::string& prompt);
    double ask_number(const std::string& prompt, const std::string& what);

    // returns false when the session should end
    bool dispatch(const std::string& choice);

    void create_department();
    void add_employee();
    void set_plan();
    void distribute_plan();
    void calculate_salaries();
    void save_json();
    void save_csv();
    void list_employees();
    void list_departments();
    void load_json();
    void load_csv();

    org::Registry& m_registry;
    std::istream& m_in;
    std::ostream& m_out;
    MenuConfig m_cfg;
};

void MenuSession::print_menu() {
    if (!m_cfg.show_prompts) return;
    m_out << "\n===== Menu =====\n"
          << "1. Create department\n"
          << "2. Add employee\n"
          << "3. Set department plan\n"
          << "4. Distribute plan\n"
          << "5. Calculate salaries\n"
          << "6. Save to JSON\n"
          << "7. Save to CSV\n"
          << "8. List employees\n"
          << "9. List departments\n"
          << "10. Load from JSON\n"
          << "11. Load from CSV\n"
          << "12. Exit\n";
}

std::string MenuSession::ask(const std::string& prompt) {
    if (m_cfg.show_prompts) m_out << prompt << ": " << std::flush;
    std::string line;
    if (!std::getline(m_in, line)) throw EndOfInput{};
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

double MenuSession::ask_number(const std::string& prompt, const std::string& what) {
    return textutil::parse_double(ask(prompt), what);
}

int MenuSession::run() {
    while (true) {
        print_menu();
        try {
            const std::string choice = textutil::trim(ask("Your choice"));
            if (!dispatch(choice)) break;
        } catch (const EndOfInput&) {
            break;
        } catch (const std::exception& e) {
            m_out << "error: " << e.what() << "\n";
        }
    }
    return 0;
}

bool MenuSession::dispatch(const std::string& choice) {
    if (choice == "1") create_department();
    else if (choice == "2") add_employee();
    else if (choice == "3") set_plan();
    else if (choice == "4") distribute_plan();
    else if (choice == "5") calculate_salaries();
    else if (choice == "6") save_json();
    else if (choice == "7") save_csv();
    else if (choice == "8") list_employees();
    else if (choice == "9") list_departments();
    else if (choice == "10") load_json();
    else if (choice == "11") load_csv();
    else if (choice == "12") return false;
    else m_out << "Invalid choice!\n";
    return true;
}

void MenuSession::create_department() {
    const std::string name = textutil::trim(ask("Department name"));
    const bool existed = m_registry.find_department(name) != nullptr;
    m_registry.create_department(name);
    if (existed) m_out << "Department " << name << " already exists.\n";
    else m_out << "Department " << name << " created.\n";
}

void MenuSession::add_employee() {
    org::EmployeeDraft draft;
    draft.name = textutil::trim(ask("Employee name"));
    draft.position = textutil::trim(ask("Position"));
    const std::string dept_name = textutil::trim(ask("Department"));
    draft.base_salary = ask_number("Base salary", "base salary");

    if (m_cfg.show_prompts) {
        m_out << "Bonus scheme:\n"
              << "1. Fixed amount\n"
              << "2. 10% of base salary\n"
              << "3. Plan performance (20% of base salary)\n";
    }
    const std::string bonus_choice = textutil::trim(ask("Your choice"));
    double fixed_amount = 0.0;
    if (bonus_choice == "1") fixed_amount = ask_number("Fixed bonus amount", "bonus amount");
    draft.bonus_scheme = payroll::bonus_scheme_from_code(bonus_choice, fixed_amount);

    if (m_cfg.show_prompts) {
        m_out << "Payment scheme:\n"
              << "1. Base salary + bonus\n"
              << "2. Per produced unit + bonus\n"
              << "3. Plan fulfilment + bonus\n";
    }
    draft.payment_scheme = payroll::payment_scheme_from_code(ask("Your choice"));
    draft.role = org::role_from_name(ask("Role (staff/manager, empty = staff)"));

    const std::string name = draft.name;
    const org::Employee& added = m_registry.add_employee(dept_name, std::move(draft));
    m_out << "Employee " << name << " added.\n";
    if (added.is_manager() && added.department().manager() == &added) {
        m_out << "Employee " << name << " manages " << dept_name << ".\n";
    }
}

void MenuSession::set_plan() {
    const std::string dept_name = textutil::trim(ask("Department name"));
    const std::string month = textutil::trim(ask("Month (YYYY-MM)"));
    const double plan = ask_number("Plan", "plan");
    m_registry.set_plan(dept_name, month, plan);
    m_out << "Plan saved.\n";
}

void MenuSession::distribute_plan() {
    const std::string dept_name = textutil::trim(ask("Department name"));
    const std::string month = textutil::trim(ask("Month (YYYY-MM)"));
    m_registry.distribute_plan(dept_name, month);
    m_out << "Plan distributed.\n";
}

void MenuSession::calculate_salaries() {
    const std::string month = textutil::trim(ask("Month (YYYY-MM)"));
    const auto lines = m_registry.calculate_salaries(month);
    if (lines.empty()) {
        m_out << "No employees.\n";
        return;
    }

    const auto flags = m_out.flags();
    const auto prec = m_out.precision();
    m_out << std::fixed << std::setprecision(m_cfg.salary_precision);
    for (const auto& l : lines) {
        m_out << l.employee->name() << " (" << l.employee->position() << ") - salary for "
              << month << ": " << l.salary << "\n";
    }
    m_out.flags(flags);
    m_out.precision(prec);
}

void MenuSession::save_json() {
    const std::string path = textutil::trim(ask("JSON file path"));
    io::save_json_records(path, m_registry.export_records());
    m_out << "Data saved to " << path << ".\n";
}

void MenuSession::save_csv() {
    const std::string path = textutil::trim(ask("CSV file path"));
    io::save_csv_records(path, m_registry.export_records());
    m_out << "Data saved to " << path << ".\n";
}

void MenuSession::list_employees() {
    if (m_registry.employees().empty()) {
        m_out << "No employees.\n";
        return;
    }
    for (const auto& e : m_registry.employees()) {
        m_out << e->name() << " - " << e->position() << " (" << e->department().name() << ")";
        if (e->is_manager()) m_out << " [manager]";
        m_out << "\n";
    }
}

void MenuSession::list_departments() {
    if (m_registry.departments().empty()) {
        m_out << "No departments.\n";
        return;
    }
    for (const auto& d : m_registry.departments()) {
        m_out << d->name() << " - employees: " << d->employees().size();
        if (d->manager()) m_out << ", manager: " << d->manager()->name();
        m_out << "\n";
    }
}

void MenuSession::load_json() {
    const std::string path = textutil::trim(ask("JSON file path"));
    const size_t n = m_registry.import_records(io::load_json_records(path));
    m_out << "Loaded " << n << " employees.\n";
}

void MenuSession::load_csv() {
    const std::string path = textutil::trim(ask("CSV file path"));
    const size_t n = m_registry.import_records(io::load_csv_records(path));
    m_out << "Loaded " << n << " employees.\n";
}

}  // namespace

int run_menu(org::Registry& registry, std::istream& in, std::ostream& out, const MenuConfig& cfg) {
    MenuSession session(registry, in, out, cfg);
    return session.run();
}

}  // namespace cli
