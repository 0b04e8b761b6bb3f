#include "execution/PaperOrderExecutor.h"
#include "common/Logger.h"

namespace rankfolio {
namespace execution {

PaperOrderExecutor::PaperOrderExecutor(std::string trade_date)
    : trade_date_(std::move(trade_date))
{
}

OrderReport PaperOrderExecutor::execute(const portfolio::PlannedOrder& order) {
    OrderReport report;
    report.order_id = "paper-" + std::to_string(++order_seq_);
    report.symbol = order.symbol;
    report.side = order.side;
    report.requested_quantity = order.quantity;

    if (order.quantity <= 0 || order.price <= 0.0) {
        report.status = OrderStatus::REJECTED;
        report.terminal = true;
        report.message = "invalid quantity or price";
        LOG_WARN("Paper order {} {} rejected: {}", orderSideToString(order.side), order.symbol, report.message);
        return report;
    }

    report.status = OrderStatus::FILLED;
    report.filled_quantity = order.quantity;
    report.avg_price = order.price;
    report.terminal = true;

    LOG_INFO(
        "Execution lifecycle: source={}, order_id={}, symbol={}, side={}, status={}, filled={}, quantity={}, terminal={}",
        "paper",
        report.order_id,
        report.symbol,
        orderSideToString(report.side),
        orderStatusToString(report.status),
        report.filled_quantity,
        report.requested_quantity,
        report.terminal ? "true" : "false"
    );
    Logger::getInstance().logTrade(trade_date_, order.symbol, orderSideToString(order.side),
                                   order.price, report.filled_quantity, "paper");
    return report;
}

} // namespace execution
} // namespace rankfolio
