#include <iomanip>
#include <iostream>
#include <string>

#include <tempora.hpp>

using namespace tempora;

// Helper function to print a date with its validity
void printDate(const YearMonthDay& ymd, const std::string& label) {
    std::cout << label << ": " << std::setfill('0') << std::setw(4) << ymd.year() << "-"
              << std::setw(2) << ymd.month() << "-" << std::setw(2) << ymd.day()
              << std::setfill(' ');
    if (auto w = ymd.weekday()) {
        std::cout << " (" << weekday_string(*w) << ")\n";
    } else {
        std::cout << " [" << time_error_string(w.error()) << "]\n";
    }
}

// Helper function to print a time of day
template <typename D>
void printTimeOfDay(const TimeOfDay<D>& tod, const std::string& label) {
    std::cout << label << ": " << std::setfill('0') << std::setw(2) << tod.hours().count() << ":"
              << std::setw(2) << tod.minutes().count() << ":" << std::setw(2)
              << tod.seconds().count() << "." << std::setw(3) << tod.subseconds().count()
              << std::setfill(' ') << "\n";
}

int main() {
    std::cout << "TEMPORA Calendar Examples\n";
    std::cout << "=========================\n\n";

    // Example 1: Today's date from the system clock
    std::cout << "1. Current Date and Time\n";
    std::cout << "------------------------\n";

    auto now = SystemClock::now();
    auto today = floor<Days>(now);
    if (!today) {
        std::cerr << "Cannot read today's date: " << time_error_string(today.error()) << "\n";
        return 1;
    }
    printDate(YearMonthDay(*today), "Today (UTC)");

    if (auto since_midnight = now - *today) {
        if (auto ms = floor<Milliseconds>(*since_midnight)) {
            printTimeOfDay(TimeOfDay<Milliseconds>(*ms), "Time (UTC)");
        }
    }
    std::cout << "\n";

    // Example 2: Field arithmetic and day policies
    std::cout << "2. Month Arithmetic\n";
    std::cout << "-------------------\n";

    YearMonthDay jan31(2024, 1, 31);
    printDate(jan31, "Start");

    auto feb31 = jan31 + CalendarMonths(1);
    if (feb31) {
        printDate(*feb31, "+1 month (fields only)");
        printDate(clamp_to_month_end(*feb31), "clamp_to_month_end");
        if (auto rolled = roll_over(*feb31)) {
            printDate(*rolled, "roll_over");
        }
    }
    std::cout << "\n";

    // Example 3: Serial arithmetic
    std::cout << "3. Day Arithmetic\n";
    std::cout << "-----------------\n";

    if (auto start = YearMonthDay(2024, 2, 27).to_sys_days()) {
        for (int i = 0; i < 4; ++i) {
            if (auto day = *start + Days(i)) {
                printDate(YearMonthDay(*day), "  2024-02-27 + " + std::to_string(i) + " days");
            }
        }
    }
    std::cout << "\n";

    // Example 4: Time scales
    std::cout << "4. Time Scales\n";
    std::cout << "--------------\n";

    SysSeconds new_year(Seconds(1'483'228'800));
    auto utc = utc_from_sys(new_year);
    if (!utc) {
        std::cerr << "UTC conversion failed: " << time_error_string(utc.error()) << "\n";
        return 1;
    }
    std::cout << "2017-01-01 system seconds: " << new_year.since_epoch().count() << "\n";
    std::cout << "  UTC seconds: " << utc->since_epoch().count() << "\n";

    if (auto tai = tai_from_utc(*utc)) {
        std::cout << "  TAI seconds: " << tai->since_epoch().count() << "\n";
    }
    if (auto gps = gps_from_utc(*utc)) {
        std::cout << "  GPS seconds: " << gps->since_epoch().count() << "\n";
    }

    UtcSeconds leap(Seconds(1'483'228'826));
    if (auto info = leap_second_info(leap)) {
        std::cout << "  UTC second " << leap.since_epoch().count()
                  << (info->is_leap_second ? " is" : " is not") << " a leap second ("
                  << info->elapsed.count() << " inserted so far)\n";
    }

    return 0;
}
